#include "io/cli_args.h"

#include <cstdint>
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/errors.h"

namespace qpscd {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw UsageError(flag + ": not an integer: '" + value + "'");
    }
}

uint64_t parse_u64(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(value, &pos);
        if (pos != value.size() || value.find('-') != std::string::npos) {
            throw std::invalid_argument(value);
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        throw UsageError(flag + ": not an unsigned integer: '" + value + "'");
    }
}

}  // anonymous namespace

CliArgs parse_args(int argc, const char* const argv[]) {
    CliArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) throw UsageError("--config needs a value");
            args.config_path = argv[++i];
        } else if (arg == "--per-epoch-perm") {
            args.overrides.push_back(arg);
            args.overrides.push_back("");
        } else if (arg == "--epochs" || arg == "--sync" ||
                   arg == "--replicas" || arg == "--threads" ||
                   arg == "--seed" || arg == "--result-json") {
            if (i + 1 >= argc) throw UsageError(arg + " needs a value");
            args.overrides.push_back(arg);
            args.overrides.push_back(argv[++i]);
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (args.help) return args;
    if (positional.size() < 2) {
        throw UsageError("expected <input data folder> <output file>");
    }
    if (positional.size() > 2) {
        spdlog::warn("ignoring {} extra argument(s) after <output file>",
                     positional.size() - 2);
    }
    args.input_dir = positional[0];
    args.output_path = positional[1];
    return args;
}

void apply_overrides(const CliArgs& args, SolveConfig& cfg) {
    for (size_t k = 0; k + 1 < args.overrides.size(); k += 2) {
        const std::string& flag = args.overrides[k];
        const std::string& value = args.overrides[k + 1];
        if (flag == "--epochs") {
            cfg.scd.num_epochs = parse_int(flag, value);
        } else if (flag == "--sync") {
            cfg.scd.sync_interval = parse_int(flag, value);
        } else if (flag == "--replicas") {
            cfg.scd.num_replicas = parse_int(flag, value);
        } else if (flag == "--threads") {
            cfg.scd.threads_per_replica = parse_int(flag, value);
        } else if (flag == "--seed") {
            cfg.scd.seed = parse_u64(flag, value);
        } else if (flag == "--per-epoch-perm") {
            cfg.scd.permutation_policy = PermutationPolicy::kPerEpoch;
        } else if (flag == "--result-json") {
            cfg.result_json = value;
        }
    }
}

SolveConfig resolve_config(const CliArgs& args) {
    SolveConfig cfg;
    if (!args.config_path.empty()) {
        spdlog::info("Loading config from {}", args.config_path);
        cfg = load_solve_config(args.config_path);
    }
    apply_overrides(args, cfg);
    cfg.scd.validate();
    return cfg;
}

std::vector<std::string> usage_lines() {
    return {
        "Usage: qpscd <input data folder> <output file> [options]",
        "  <input data folder> must contain Q.csv, p.csv, lb.csv, ub.csv, x.csv",
        "  --config <path>     JSON configuration file",
        "  --epochs <n>        Number of epochs (default 100)",
        "  --sync <n>          Reconcile every n epochs (default 10)",
        "  --replicas <n>      Iterate replicas (default: NUMA domains)",
        "  --threads <n>       Workers per replica (default: domain CPUs)",
        "  --per-epoch-perm    Draw a new permutation every epoch",
        "  --seed <n>          Permutation seed (default: random)",
        "  --result-json <p>   Write a JSON summary",
    };
}

}  // namespace qpscd
