#include "external_signal.hpp"
#include "process.hpp"
#include <algorithm>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace {

struct ToolJob {
    std::string file;
    const ToolAdapter* adapter = nullptr;
};

}  // namespace

ExternalSignalAdapter::ExternalSignalAdapter(ToolRegistry registry, ExternalToolOptions options)
    : registry_(std::move(registry)),
      options_(std::move(options)) {}

void ExternalSignalAdapter::accumulate(ExternalSignal& signal, const ToolOutcome& outcome) {
    ++signal.invocations;
    signal.raw[outcome.file] += outcome.findings;
    if (outcome.warning) {
        ++signal.failures;
        signal.warnings.push_back(*outcome.warning);
    }
}

ExternalSignal ExternalSignalAdapter::fromInvocations(const std::vector<ToolInvocation>& invocations) const {
    ExternalSignal signal;
    for (const auto& invocation : invocations) {
        const ToolAdapter* match = nullptr;
        for (const auto* adapter : registry_.adaptersFor(invocation.file)) {
            if (adapter->name() == invocation.tool) {
                match = adapter;
                break;
            }
        }
        if (!match) {
            signal.warnings.push_back({invocation.tool, invocation.file, "no adapter registered for this tool and file"});
            continue;
        }
        accumulate(signal, translateInvocation(*match, invocation));
    }
    return signal;
}

ExternalSignal ExternalSignalAdapter::collect(const fs::path& root, const std::vector<std::string>& files) const {
    ExternalSignal signal;

    std::vector<ToolJob> jobs;
    for (const auto& file : files) {
        for (const auto* adapter : registry_.adaptersFor(file)) {
            jobs.push_back({file, adapter});
        }
    }
    if (jobs.empty()) {
        return signal;
    }

    // Workers fill their own outcome slots; nothing shared is mutated outside the queue lock
    std::vector<ToolOutcome> outcomes(jobs.size());
    std::vector<char> ran(jobs.size(), 0);
    std::queue<size_t> pending;
    for (size_t i = 0; i < jobs.size(); ++i) {
        pending.push(i);
    }
    std::mutex queueMutex;
    const CancellationToken* cancel = options_.cancel.get();

    auto worker = [&]() {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queueMutex);
                if (pending.empty()) {
                    return;
                }
                if (cancel && cancel->isCancelled()) {
                    return;
                }
                index = pending.front();
                pending.pop();
            }

            const ToolJob& job = jobs[index];
            ProcessResult result;
            try {
                result = runProcess(job.adapter->commandFor(root / job.file), root, options_.timeout);
            } catch (const std::exception& e) {
                result.launchFailed = true;
                result.launchError = e.what();
            }

            ToolInvocation invocation;
            invocation.tool = job.adapter->name();
            invocation.file = job.file;
            invocation.exitStatus = result.exitCode;
            invocation.stdoutText = result.stdoutText;
            invocation.stderrText = result.stderrText;
            invocation.launchFailed = result.launchFailed;
            invocation.timedOut = result.timedOut;
            invocation.launchError = result.launchError;

            outcomes[index] = translateInvocation(*job.adapter, invocation);
            ran[index] = 1;
        }
    };

    unsigned int threadCount = std::max(1u, std::min(options_.concurrency, static_cast<unsigned int>(jobs.size())));
    std::vector<std::thread> workers;
    try {
        for (unsigned int i = 0; i < threadCount; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        signal.warnings.push_back({"tools", "workers", std::string("could not create worker thread: ") + e.what()});
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& thread : workers) {
        thread.join();
    }

    size_t skipped = 0;
    for (size_t i = 0; i < jobs.size(); ++i) {
        if (!ran[i]) {
            ++skipped;
            continue;
        }
        accumulate(signal, outcomes[i]);
    }
    if (skipped > 0) {
        signal.warnings.push_back({"tools", root.string(),
                                   "cancelled with " + std::to_string(skipped) + " tool runs not started"});
    }
    return signal;
}
