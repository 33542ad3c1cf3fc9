//! # Parallel Builder Implementation
//!
//! Jobs are created for every requested module and, transitively, every
//! module it imports. Assembly happens up front on the calling thread; only
//! the pipeline from monomorphization to emission runs on the workers.
//!
//! ## Job States
//!
//! | From      | To        | When                                       |
//! |-----------|-----------|--------------------------------------------|
//! | `Pending` | `Failed`  | assembly or the module's pipeline failed   |
//! | `Pending` | `Built`   | pipeline (and optional write) succeeded    |
//! | `Pending` | `Skipped` | a module it imports failed                 |
//!
//! All job state changes happen under `job_mutex_`.

#include "driver/parallel_builder.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <thread>

namespace a2c::driver {

auto module_status_name(ModuleStatus status) -> const char* {
    switch (status) {
    case ModuleStatus::Pending:
        return "pending";
    case ModuleStatus::Built:
        return "built";
    case ModuleStatus::Failed:
        return "failed";
    case ModuleStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

// ============================================================================
// DependencyGraph Implementation
// ============================================================================

/// Adds a module and the modules it imports.
///
/// Every import is expected to be added as a module of its own before the
/// build starts.
void DependencyGraph::add_module(const std::string& module, const std::vector<std::string>& deps) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> unique;
    for (const auto& dep : deps) {
        if (std::find(unique.begin(), unique.end(), dep) == unique.end())
            unique.push_back(dep);
    }

    pending_count_[module] = static_cast<int>(unique.size());
    for (const auto& dep : unique) {
        rdeps_[dep].push_back(module);
    }
    deps_[module] = std::move(unique);
}

auto DependencyGraph::ready_modules() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ready;
    for (const auto& [module, _] : deps_) {
        if (pending_count_.at(module) == 0 && completed_.count(module) == 0) {
            ready.push_back(module);
        }
    }
    return ready;
}

auto DependencyGraph::mark_complete(const std::string& module) -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    completed_.insert(module);

    std::vector<std::string> ready;
    auto it = rdeps_.find(module);
    if (it != rdeps_.end()) {
        for (const auto& dependent : it->second) {
            auto count = pending_count_.find(dependent);
            if (count != pending_count_.end() && --count->second == 0) {
                ready.push_back(dependent);
            }
        }
    }
    std::sort(ready.begin(), ready.end());
    return ready;
}

auto DependencyGraph::dependents_of(const std::string& module) const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> found;
    std::deque<std::string> work{module};
    while (!work.empty()) {
        auto current = work.front();
        work.pop_front();
        auto it = rdeps_.find(current);
        if (it == rdeps_.end())
            continue;
        for (const auto& dependent : it->second) {
            if (found.insert(dependent).second)
                work.push_back(dependent);
        }
    }
    found.erase(module);
    return {found.begin(), found.end()};
}

/// Finds an import cycle with a DFS; the returned path starts and ends with
/// the same module.
auto DependencyGraph::find_cycle() const -> std::optional<std::vector<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);

    std::unordered_set<std::string> visited;
    std::vector<std::string> rec_stack;
    std::optional<std::vector<std::string>> cycle;

    std::function<bool(const std::string&)> dfs = [&](const std::string& node) -> bool {
        visited.insert(node);
        rec_stack.push_back(node);

        auto it = deps_.find(node);
        if (it != deps_.end()) {
            for (const auto& dep : it->second) {
                if (deps_.find(dep) == deps_.end())
                    continue;

                auto on_stack = std::find(rec_stack.begin(), rec_stack.end(), dep);
                if (on_stack != rec_stack.end()) {
                    std::vector<std::string> path(on_stack, rec_stack.end());
                    path.push_back(dep);
                    cycle = std::move(path);
                    return true;
                }
                if (visited.count(dep) == 0 && dfs(dep)) {
                    return true;
                }
            }
        }

        rec_stack.pop_back();
        return false;
    };

    for (const auto& [module, _] : deps_) {
        if (visited.count(module) == 0 && dfs(module)) {
            return cycle;
        }
    }
    return std::nullopt;
}

auto DependencyGraph::topological_sort() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> temp_visited;

    std::function<void(const std::string&)> visit = [&](const std::string& node) {
        if (visited.count(node) > 0 || temp_visited.count(node) > 0)
            return;

        temp_visited.insert(node);
        auto it = deps_.find(node);
        if (it != deps_.end()) {
            for (const auto& dep : it->second) {
                if (deps_.find(dep) != deps_.end()) {
                    visit(dep);
                }
            }
        }
        temp_visited.erase(node);
        visited.insert(node);
        result.push_back(node);
    };

    for (const auto& [module, _] : deps_) {
        visit(module);
    }
    return result;
}

// ============================================================================
// BuildQueue Implementation
// ============================================================================

void BuildQueue::push(std::shared_ptr<ModuleJob> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(job));
    cv_.notify_one();
}

/// Pops a job, waiting up to `timeout_ms`. Returns nullptr if the queue is
/// still empty or the queue was stopped.
auto BuildQueue::pop(int timeout_ms) -> std::shared_ptr<ModuleJob> {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty() || stop_flag_; });
    }

    if (queue_.empty()) {
        return nullptr;
    }

    auto job = queue_.front();
    queue_.pop();
    return job;
}

void BuildQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_flag_ = true;
    cv_.notify_all();
}

auto BuildQueue::is_empty() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

// ============================================================================
// BuildReport
// ============================================================================

auto BuildReport::success() const -> bool {
    return std::all_of(modules.begin(), modules.end(),
                       [](const ModuleResult& m) { return m.status == ModuleStatus::Built; });
}

auto BuildReport::count(ModuleStatus status) const -> size_t {
    return static_cast<size_t>(
        std::count_if(modules.begin(), modules.end(),
                      [status](const ModuleResult& m) { return m.status == status; }));
}

auto BuildReport::find(const std::string& module) const -> const ModuleResult* {
    for (const auto& result : modules) {
        if (result.module == module)
            return &result;
    }
    return nullptr;
}

// ============================================================================
// ParallelBuilder Implementation
// ============================================================================

ParallelBuilder::ParallelBuilder(CompilationRun& run, int num_threads)
    : run_(run), num_threads_(num_threads) {
    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0)
            num_threads_ = 1;
    }
}

void ParallelBuilder::collect_jobs(const assemble::FragmentProvider& provider,
                                   const std::vector<std::string>& modules) {
    assemble::Assembler assembler(provider);
    std::deque<std::string> work(modules.begin(), modules.end());

    while (!work.empty()) {
        auto name = work.front();
        work.pop_front();
        if (jobs_.count(name) > 0)
            continue;

        auto job = std::make_shared<ModuleJob>();
        job->module = name;
        jobs_.emplace(name, job);

        auto assembled = assembler.assemble(name, run_.options().scenario);
        if (is_err(assembled)) {
            fail_early(*job, unwrap_err(assembled));
            continue;
        }
        job->unit = std::move(unwrap(assembled));
        job->dependencies = job->unit.imports;
        for (const auto& dep : job->dependencies) {
            work.push_back(dep);
        }
    }
}

void ParallelBuilder::fail_early(ModuleJob& job, diag::Diagnostic error) {
    A2C_LOG_DEBUG("driver", "Module " << job.module << " failed: " << diag::summarize(error));
    job.status = ModuleStatus::Failed;
    job.error = std::move(error);
    stats_.failed++;
}

auto ParallelBuilder::build(const assemble::FragmentProvider& provider,
                            const std::vector<std::string>& modules)
    -> Result<BuildReport, diag::Diagnostic> {
    jobs_.clear();
    stats_.reset();
    ready_queue_ = make_box<BuildQueue>();
    dep_graph_ = make_box<DependencyGraph>();

    collect_jobs(provider, modules.empty() ? provider.modules() : modules);
    stats_.total = static_cast<int>(jobs_.size());
    if (jobs_.empty()) {
        return BuildReport{};
    }

    for (const auto& [name, job] : jobs_) {
        dep_graph_->add_module(name, job->dependencies);
    }
    if (auto cycle = dep_graph_->find_cycle()) {
        auto& first = (*cycle)[0];
        A2C_LOG_ERROR("driver", "Import cycle: " << describe_cycle(*cycle));
        return diag::make_diagnostic(diag::ErrorKind::MalformedTree, first, "",
                                     "import cycle: " + describe_cycle(*cycle));
    }

    // Modules that failed to assemble block their importers from the start
    for (const auto& [name, job] : jobs_) {
        if (job->status == ModuleStatus::Failed)
            skip_dependents(*job);
    }
    for (const auto& name : dep_graph_->ready_modules()) {
        auto& job = jobs_.at(name);
        if (job->status == ModuleStatus::Pending)
            ready_queue_->push(job);
    }

    int pending = stats_.total - stats_.finished();
    int actual_threads = std::min(pending, num_threads_);
    A2C_LOG_INFO("driver", "Building " << stats_.total << " modules with " << actual_threads
                                       << " threads");

    std::vector<std::thread> workers;
    for (int i = 0; i < actual_threads; ++i) {
        workers.emplace_back(&ParallelBuilder::worker_thread, this);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    A2C_LOG_INFO("driver", "Build finished: " << stats_.built << " built, " << stats_.failed
                                              << " failed, " << stats_.skipped << " skipped");
    return make_report();
}

void ParallelBuilder::worker_thread() {
    while (true) {
        auto job = ready_queue_->pop(100);
        if (!job) {
            if (stats_.finished() >= stats_.total) {
                break;
            }
            continue;
        }

        compile_job(*job);

        std::lock_guard<std::mutex> lock(job_mutex_);
        if (job->status == ModuleStatus::Built) {
            stats_.built++;
            notify_dependents(*job);
        } else {
            stats_.failed++;
            skip_dependents(*job);
        }
        if (stats_.finished() >= stats_.total) {
            ready_queue_->stop();
        }
    }
}

void ParallelBuilder::compile_job(ModuleJob& job) {
    std::vector<tree::ImportedModule> imports;
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        for (const auto& dep : job.dependencies) {
            imports.push_back(jobs_.at(dep)->output->as_import());
        }
    }

    auto compiled = run_.compile_unit(std::move(job.unit), imports);
    if (is_err(compiled)) {
        job.status = ModuleStatus::Failed;
        job.error = unwrap_err(compiled);
        return;
    }
    auto output = unwrap(compiled);

    if (output_dir_) {
        auto written = codegen::write_artifacts(output->artifacts, *output_dir_);
        if (is_err(written)) {
            job.status = ModuleStatus::Failed;
            job.error = unwrap_err(written);
            return;
        }
        job.written = unwrap(written);
    }

    job.output = std::move(output);
    job.status = ModuleStatus::Built;
}

void ParallelBuilder::notify_dependents(const ModuleJob& job) {
    for (const auto& name : dep_graph_->mark_complete(job.module)) {
        auto& dependent = jobs_.at(name);
        if (dependent->status == ModuleStatus::Pending) {
            ready_queue_->push(dependent);
        }
    }
}

void ParallelBuilder::skip_dependents(const ModuleJob& job) {
    for (const auto& name : dep_graph_->dependents_of(job.module)) {
        auto& dependent = jobs_.at(name);
        if (dependent->status != ModuleStatus::Pending)
            continue;
        A2C_LOG_DEBUG("driver", "Skipping " << name << ": import " << job.module << " failed");
        dependent->status = ModuleStatus::Skipped;
        dependent->blocked_by = job.module;
        stats_.skipped++;
    }
}

auto ParallelBuilder::make_report() const -> BuildReport {
    BuildReport report;
    for (const auto& [name, job] : jobs_) {
        ModuleResult result;
        result.module = name;
        result.status = job->status;
        result.error = job->error;
        result.blocked_by = job->blocked_by;
        result.output = job->output;
        result.written = job->written;
        report.modules.push_back(std::move(result));
    }
    return report;
}

} // namespace a2c::driver
