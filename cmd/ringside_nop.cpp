// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <ringside/async/completion.hpp>
#include <ringside/async/op.hpp>
#include <ringside/async/ops.hpp>
#include <ringside/async/reactor.hpp>
#include <ringside/async/uring_fiber_scheduler.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <boost/fiber/fiber.hpp>
#include <boost/fiber/operations.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <vector>

using namespace ringside;
using namespace ringside::async;

namespace
{
    // Submits `batch` no-ops at a time and drives the reactor by hand
    uint64_t run_batched(Reactor const &reactor, uint64_t const count, unsigned const batch)
    {
        uint64_t failed = 0;
        std::vector<Op> ops;
        ops.reserve(batch);
        for (uint64_t done = 0; done < count;) {
            auto const n =
                static_cast<unsigned>(std::min<uint64_t>(batch, count - done));
            reactor.with([&] {
                for (unsigned i = 0; i < n; ++i) {
                    ops.push_back(nop());
                }
            });
            size_t outstanding = ops.size();
            while (outstanding > 0) {
                for (auto &op : ops) {
                    if (op.is_finished()) {
                        continue;
                    }
                    if (auto const r = op.poll([] {}); r.has_value()) {
                        if (!r->result) {
                            ++failed;
                        }
                        --outstanding;
                    }
                }
                if (outstanding == 0) {
                    break;
                }
                if (auto const r = reactor.flush_submissions(); !r) {
                    LOG_ERROR(
                        "submission failed: {}", r.assume_error().message());
                    return count;
                }
                if (auto const r = reactor.wait(); !r) {
                    LOG_WARNING("wait failed: {}", r.assume_error().message());
                }
                reactor.flush_completions();
            }
            ops.clear();
            done += n;
        }
        return failed;
    }

    // Spreads the no-ops over `nfibers` fibers which each await one at a time
    uint64_t run_fibers(Reactor const &reactor, uint64_t const count, unsigned const nfibers)
    {
        uint64_t failed = 0;
        boost::fibers::use_scheduling_algorithm<UringFiberScheduler>(
            reactor.handle());
        reactor.with([&] {
            std::vector<boost::fibers::fiber> fibers;
            fibers.reserve(nfibers);
            for (unsigned f = 0; f < nfibers; ++f) {
                uint64_t const share =
                    count / nfibers + (f < count % nfibers ? 1 : 0);
                fibers.emplace_back([share, &failed] {
                    for (uint64_t i = 0; i < share; ++i) {
                        Op op = nop();
                        if (!await_op(op).result) {
                            ++failed;
                        }
                    }
                });
            }
            for (auto &fiber : fibers) {
                fiber.join();
            }
        });
        return failed;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"ringside-nop"};
    cli.option_defaults()->always_capture_default();

    unsigned entries = ReactorConfig::DEFAULT_ENTRIES;
    uint64_t count = 1'000'000;
    unsigned batch = 64;
    unsigned nfibers = 0;
    std::optional<unsigned> sq_thread_cpu;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--entries", entries, "io_uring submission queue entries")
        ->check(CLI::Range(1u, 32768u));
    cli.add_option("--count", count, "number of no-op operations to run");
    cli.add_option("--batch", batch, "no-ops submitted per batch")
        ->check(CLI::PositiveNumber);
    cli.add_option(
        "--nfibers",
        nfibers,
        "run through this many fibers instead of batches, 0 to disable");
    cli.add_option(
        "--sq_thread_cpu",
        sq_thread_cpu,
        "sq_thread_cpu field in io_uring_params, to specify the cpu set "
        "kernel poll thread is bound to in SQPOLL mode");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto reactor = Reactor::create(ReactorConfig{
        .entries = entries, .sq_thread_cpu = sq_thread_cpu});
    if (!reactor) {
        LOG_ERROR(
            "could not create reactor: {}", reactor.error().message());
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "running {} no-ops on fd {} {}",
        count,
        reactor.value().fd(),
        nfibers > 0 ? "through fibers" : "in batches");
    auto const begin = std::chrono::steady_clock::now();
    uint64_t const failed = nfibers > 0
                                ? run_fibers(reactor.value(), count, nfibers)
                                : run_batched(reactor.value(), count, batch);
    auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - begin);
    RINGSIDE_ASSERT(reactor.value().operation_count() == 0);

    double const seconds = static_cast<double>(elapsed.count()) / 1'000'000;
    LOG_INFO(
        "completed {} no-ops in {}us ({} failed), {:.0f} ops/sec",
        count,
        elapsed.count(),
        failed,
        seconds > 0 ? static_cast<double>(count) / seconds : 0.0);
    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
