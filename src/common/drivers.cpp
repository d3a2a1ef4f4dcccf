#include "kspacing/drivers.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "kspacing/bit_dataset.hpp"
#include "kspacing/cli.hpp"
#include "kspacing/csv.hpp"
#include "kspacing/edge_list.hpp"
#include "kspacing/errors.hpp"
#include "kspacing/hamming.hpp"
#include "kspacing/spacing.hpp"
#include "kspacing/timer.hpp"

namespace kspacing
{

    int run_explicit_spacing(int argc, char **argv, std::ostream &out, std::ostream &err)
    {
        ArgParser cli("Maximum spacing of a k-clustering over an explicit distance graph.");
        cli.add_option(OptionSpec{.longName = "input", .shortName = 'i', .type = ArgType::String, .valueName = "FILE|-", .help = "Edge list ('<N>' header, then '<a> <b> <distance>' rows) or '-' for stdin", .required = true});
        cli.add_option(OptionSpec{.longName = "k", .shortName = 'k', .type = ArgType::String, .valueName = "LIST", .help = "Target cluster counts: K, K1,K2,... or LO..HI", .required = true});
        cli.add_option(OptionSpec{.longName = "label-base", .shortName = '\0', .type = ArgType::UInt64, .valueName = "B", .help = "Smallest element label in the file", .required = false, .defaultValue = "1"});
        cli.add_option(OptionSpec{.longName = "csv-out", .shortName = '\0', .type = ArgType::String, .valueName = "FILE|-", .help = "Write k,spacing rows as CSV", .required = false});
        cli.add_flag("verbose", 'v', "Trace every consumed edge on stderr");

        bool proceed = true;
        std::vector<uint32_t> ks;
        uint32_t label_base = 1;
        try
        {
            proceed = cli.parse(argc, argv);
            if (proceed)
            {
                ks = parse_uint_list(cli.get_string("k"));
                const unsigned long long base = cli.get_uint64("label-base");
                if (base > std::numeric_limits<uint32_t>::max())
                    throw std::out_of_range("label-base out of range: " + std::to_string(base));
                label_base = static_cast<uint32_t>(base);
            }
        }
        catch (const std::exception &e)
        {
            err << cli.usage(argv[0]) << "\n"
                << e.what() << "\n";
            return 1;
        }
        if (!proceed)
        {
            out << cli.help(argv[0]);
            return 0;
        }

        const std::string path = cli.get_string("input");

        Timer t_parse;
        EdgeList graph = (path == "-") ? EdgeList(std::cin, label_base) : EdgeList(path, label_base);
        const double sec_parse = t_parse.sec();
        if (!graph.is_valid())
        {
            err << "Failed to parse edge list: " << path << "\n";
            return 2;
        }

        const uint32_t n = graph.get_element_count();
        const std::size_t edge_count = graph.get_edges().size();

        std::vector<std::pair<uint32_t, int64_t>> results;
        results.reserve(ks.size());
        try
        {
            ExplicitSpacingClusterer clusterer(n, std::move(graph.get_edges()));
            ExplicitSpacingClusterer::Config cfg = clusterer.config();
            cfg.verbose = cli.get_flag("verbose");
            cfg.log = &err;
            clusterer.set_config(cfg);

            for (uint32_t k : ks)
            {
                Timer t_cluster;
                const int64_t spacing = clusterer.spacing_for_clusters(k);
                const double sec_cluster = t_cluster.sec();
                results.emplace_back(k, spacing);
                out << "elements=" << n
                    << " edges=" << edge_count
                    << " k=" << k
                    << " spacing=" << spacing
                    << " parse_sec=" << sec_parse
                    << " cluster_sec=" << sec_cluster
                    << "\n";
            }
        }
        catch (const InvalidClusterTarget &e)
        {
            err << "Invalid cluster target: " << e.what() << "\n";
            return 4;
        }
        catch (const std::exception &e)
        {
            err << "Clustering failed: " << e.what() << "\n";
            return 4;
        }

        if (cli.provided("csv-out"))
        {
            const std::string out_path = cli.get_string("csv-out");
            CSVWriter csv(out_path);
            if (!csv.is_open())
            {
                err << "Failed to open CSV output file: " << out_path << "\n";
                return 3;
            }
            csv.header({"k", "spacing"});
            for (const auto &[k, spacing] : results)
                csv.row(k, spacing);
        }
        return 0;
    }

    int run_hamming_clusters(int argc, char **argv, std::ostream &out, std::ostream &err)
    {
        ArgParser cli("Largest k such that a k-clustering of bit-vectors has Hamming spacing >= T.");
        cli.add_option(OptionSpec{.longName = "input", .shortName = 'i', .type = ArgType::String, .valueName = "FILE|-", .help = "Bit dataset ('<M> <L>' header, then M rows of L bits) or '-' for stdin", .required = true});
        cli.add_option(OptionSpec{.longName = "spacing", .shortName = 's', .type = ArgType::String, .valueName = "LIST", .help = "Spacing thresholds: T, T1,T2,... or LO..HI", .required = false, .defaultValue = "3"});
        cli.add_option(OptionSpec{.longName = "csv-out", .shortName = '\0', .type = ArgType::String, .valueName = "FILE|-", .help = "Write spacing,clusters,distinct,cluster_sec rows as CSV", .required = false});
        cli.add_flag("verbose", 'v', "Trace ingestion and merges on stderr");

        bool proceed = true;
        std::vector<uint32_t> thresholds;
        try
        {
            proceed = cli.parse(argc, argv);
            if (proceed)
                thresholds = parse_uint_list(cli.get_string("spacing"));
        }
        catch (const std::exception &e)
        {
            err << cli.usage(argv[0]) << "\n"
                << e.what() << "\n";
            return 1;
        }
        if (!proceed)
        {
            out << cli.help(argv[0]);
            return 0;
        }

        const std::string path = cli.get_string("input");

        Timer t_parse;
        BitDataset data = (path == "-") ? BitDataset(std::cin) : BitDataset(path);
        const double sec_parse = t_parse.sec();
        if (!data.is_valid())
        {
            err << "Failed to parse bit dataset: " << path << "\n";
            return 2;
        }

        HammingClusterer clusterer(data.get_bit_length(), data.get_points());
        {
            HammingClusterer::Config cfg = clusterer.config();
            cfg.verbose = cli.get_flag("verbose");
            cfg.log = &err;
            clusterer.set_config(cfg);
        }

        struct Row
        {
            uint32_t spacing;
            uint32_t clusters;
            std::size_t distinct;
            double sec;
        };
        std::vector<Row> rows;
        rows.reserve(thresholds.size());
        try
        {
            for (uint32_t T : thresholds)
            {
                Timer t_cluster;
                const uint32_t clusters = clusterer.max_clusters_with_spacing(T);
                const double sec_cluster = t_cluster.sec();
                rows.push_back(Row{T, clusters, clusterer.distinct_count(), sec_cluster});

                uint32_t largest = 0;
                for (uint32_t r : clusterer.disjoint_sets().roots())
                    largest = std::max(largest, clusterer.disjoint_sets().set_size(r));

                out << "points=" << clusterer.point_count()
                    << " bits=" << clusterer.bit_length()
                    << " distinct=" << clusterer.distinct_count()
                    << " spacing=" << T
                    << " clusters=" << clusters
                    << " largest=" << largest
                    << " parse_sec=" << sec_parse
                    << " cluster_sec=" << sec_cluster
                    << "\n";
            }
        }
        catch (const InvalidDistanceParameter &e)
        {
            err << "Invalid spacing threshold: " << e.what() << "\n";
            return 4;
        }
        catch (const std::exception &e)
        {
            err << "Clustering failed: " << e.what() << "\n";
            return 4;
        }

        if (cli.provided("csv-out"))
        {
            const std::string out_path = cli.get_string("csv-out");
            CSVWriter csv(out_path);
            if (!csv.is_open())
            {
                err << "Failed to open CSV output file: " << out_path << "\n";
                return 3;
            }
            csv.header({"spacing", "clusters", "distinct", "cluster_sec"});
            for (const auto &r : rows)
                csv.row(r.spacing, r.clusters, r.distinct, r.sec);
        }
        return 0;
    }

} // namespace kspacing
