#include "io/solve_config.h"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace qpscd {

PermutationPolicy parse_permutation_policy(const std::string& name) {
    if (name == "per_solve") return PermutationPolicy::kPerSolve;
    if (name == "per_epoch") return PermutationPolicy::kPerEpoch;
    throw std::runtime_error(
        "parse_permutation_policy: unknown policy '" + name +
        "' (expected per_solve or per_epoch)");
}

SolveConfig load_solve_config(const std::string& json_path) {
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        throw std::runtime_error(
            "load_solve_config: cannot open " + json_path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("load_solve_config: " + json_path + ": " +
                                 e.what());
    }

    SolveConfig cfg;
    try {
        // Solve loop.
        if (j.contains("num_epochs"))
            cfg.scd.num_epochs = j["num_epochs"].get<int>();
        if (j.contains("sync_interval"))
            cfg.scd.sync_interval = j["sync_interval"].get<int>();
        if (j.contains("num_replicas"))
            cfg.scd.num_replicas = j["num_replicas"].get<Index>();
        if (j.contains("threads_per_replica"))
            cfg.scd.threads_per_replica = j["threads_per_replica"].get<int>();
        if (j.contains("permutation_policy")) {
            cfg.scd.permutation_policy = parse_permutation_policy(
                j["permutation_policy"].get<std::string>());
        }
        if (j.contains("seed"))
            cfg.scd.seed = j["seed"].get<uint64_t>();

        // Diagnostics.
        if (j.contains("record_history"))
            cfg.scd.record_history = j["record_history"].get<bool>();
        if (j.contains("verbose"))
            cfg.scd.verbose = j["verbose"].get<bool>();

        // Output.
        if (j.contains("result_json"))
            cfg.result_json = j["result_json"].get<std::string>();
        if (j.contains("log_level"))
            cfg.log_level = j["log_level"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("load_solve_config: " + json_path + ": " +
                                 e.what());
    }

    cfg.scd.validate();
    return cfg;
}

}  // namespace qpscd
