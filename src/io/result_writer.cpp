#include "io/result_writer.h"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace qpscd {

namespace {

nlohmann::json history_to_json(const std::vector<ScdIterInfo>& history) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& h : history) {
        arr.push_back({
            {"epoch", h.epoch},
            {"objective", h.objective},
            {"residual", h.residual}
        });
    }
    return arr;
}

}  // anonymous namespace

void write_result_json(const ScdResult& result, const ScdConfig& config,
                       const std::string& path, bool include_x) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("write_result_json: cannot open " + path);
    }

    nlohmann::json j;
    j["n"] = result.x.size();
    j["residual"] = result.residual;
    j["objective"] = result.objective;
    j["projected_gradient_norm"] = result.projected_gradient_norm;
    j["epochs"] = result.epochs;
    j["reconciliations"] = result.reconciliations;
    j["num_replicas"] = result.num_replicas;
    j["threads_per_replica"] = result.threads_per_replica;
    j["elapsed_ms"] = result.elapsed_ms;
    j["seed"] = result.seed;
    j["config"] = {
        {"num_epochs", config.num_epochs},
        {"sync_interval", config.sync_interval},
        {"permutation_policy",
         config.permutation_policy == PermutationPolicy::kPerEpoch
             ? "per_epoch" : "per_solve"}
    };
    if (!result.history.empty()) {
        j["history"] = history_to_json(result.history);
    }
    if (include_x) {
        j["x"] = std::vector<double>(result.x.data(),
                                     result.x.data() + result.x.size());
    }

    ofs << std::setw(2) << j << "\n";
}

}  // namespace qpscd
