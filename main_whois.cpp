/**
 * # resolve owner, names and location for a list of addresses
 * ./build/ipwho 8.8.8.8 1.1.1.1 10.1.2.3
 *
 * Environment:
 *   IPWHO_SUFFIX_LIST=/path/public_suffix_list.dat  IPWHO_GEO_URL=https://host/json/
 *   IPWHO_LOG=diag.txt IPWHO_LOG_LEVEL=debug
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "app_config.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "geo_resolver.hpp"
#include "ip_resolver.hpp"
#include "reserved_blocks.hpp"
#include "result_format.hpp"
#include "suffix_tree.hpp"

using namespace std;
using namespace ipwho;

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " <ip> [<ip> ...]\n"
         << "\nOutput (tab-separated, '-' when unknown):\n"
         << "  ip  asnCC:asn:cidr  cc  domain  lat,lon  host/alt  country, region, city\n"
         << "\nNotes:\n"
         << "  - Settings: IPWHO_SUFFIX_LIST, IPWHO_SUFFIX_PRIVATE, IPWHO_GEO_URL, IPWHO_ASN_REGISTRY_A,\n"
         << "    IPWHO_ASN_REGISTRY_B, IPWHO_DNS_TIMEOUT, IPWHO_SCAN_BUDGET, IPWHO_LOG, IPWHO_LOG_LEVEL.\n"
         << "  - A neighbourhood PTR scan may take up to IPWHO_SCAN_BUDGET seconds per address.\n";
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    if (argc < 2) { print_usage(argv[0]); return 1; }

    try {
        const AppConfig cfg = AppConfig::fromEnvironment([](const char *name) { return std::getenv(name); });

        // Optional diagnostics
        DiagLogger diag(cfg.log_path, cfg.log_level);
        DiagLogger *dptr = diag.ok() ? &diag : nullptr;
        if (!cfg.log_path.empty() && !diag.ok()) {
            cerr << "Warning: couldn't open log file: " << cfg.log_path << "\n";
        }

        // Data sources: any of these failing stops start-up
        const SuffixTree suffixes = SuffixTree::loadFile(cfg.suffix_list, cfg.suffix_private, dptr);
        ResolvDnsClient dns(dptr);
        GeoResolver geo(cfg.geo_url, cfg.dns_timeout, dptr);

        ResolverSettings settings;
        settings.registries = cfg.registries;
        settings.query_timeout = cfg.dns_timeout;
        settings.scan_budget = cfg.scan_budget;
        IpResolver resolver(ResolverContext{dns, geo, suffixes, reserved_blocks(), settings, dptr});

        bool failed = false;
        for (int i = 1; i < argc; ++i) {
            const string arg = argv[i];
            try {
                cout << format_line(resolver.resolve(arg)) << '\n' << flush;
            } catch (const invalid_argument &e) {
                cerr << "Error: " << arg << ": " << e.what() << '\n';
                if (dptr) dptr->warn("INPUT " + arg + ": " + e.what());
                failed = true;
            } catch (const exception &e) {
                // one bad lookup must not cost the remaining inputs
                cerr << "Error: " << arg << ": lookup failed: " << e.what() << '\n';
                if (dptr) dptr->warn("LOOKUP " + arg + ": " + e.what());
                failed = true;
            }
        }
        return failed ? 1 : 0;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
