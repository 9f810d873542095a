#include <exception>

#include <spdlog/spdlog.h>

#include "core/errors.h"
#include "io/cli_args.h"
#include "io/csv_io.h"
#include "io/result_writer.h"
#include "io/solve_config.h"
#include "numa/topology.h"
#include "solver/scd_solver.h"
#include "utils/timer.h"

namespace {

void print_usage() {
    for (const auto& line : qpscd::usage_lines()) spdlog::info("{}", line);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    qpscd::CliArgs args;
    try {
        args = qpscd::parse_args(argc, argv);
    } catch (const qpscd::UsageError& e) {
        spdlog::error("{}", e.what());
        print_usage();
        return 1;
    }
    if (args.help) {
        print_usage();
        return 0;
    }

    // Load configuration, then let the command line override it.
    qpscd::SolveConfig cfg;
    try {
        cfg = qpscd::resolve_config(args);
    } catch (const qpscd::UsageError& e) {
        spdlog::error("{}", e.what());
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    // Load problem data.
    qpscd::ProblemFiles files;
    try {
        files = qpscd::read_problem_dir(args.input_dir);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load input: {}", e.what());
        return 1;
    }
    spdlog::info("finished loading input. Q: {} x {}, p: {}, lb: {}, ub: {}",
                 files.Q.rows(), files.Q.cols(), files.p.size(),
                 files.lb.size(), files.ub.size());

    try {
        qpscd::BoxQP bqp = qpscd::make_box_qp(files);
        qpscd::NumaTopology topo = qpscd::discover_topology();
        spdlog::info("NUMA: {} domain(s){}", topo.num_domains(),
                     topo.numa_available ? "" : " (libnuma unavailable)");

        qpscd::ScdResult result;
        {
            qpscd::CpuTimer timer("solve");
            qpscd::ScdSolver solver(bqp, cfg.scd, topo);
            result = solver.solve(files.x0);
        }

        qpscd::write_vector_csv(result.x, args.output_path);
        spdlog::info("Wrote solution to {}", args.output_path);

        if (!cfg.result_json.empty()) {
            qpscd::write_result_json(result, cfg.scd, cfg.result_json);
            spdlog::info("Wrote result JSON to {}", cfg.result_json);
        }

        spdlog::info("error: {}", result.residual);
    } catch (const qpscd::InvalidDimensions& e) {
        spdlog::error("Invalid dimensions: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Solve failed: {}", e.what());
        return 1;
    }

    return 0;
}
