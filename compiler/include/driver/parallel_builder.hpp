//! # Parallel Builder
//!
//! Compiles several modules on worker threads, each module through its own
//! pipeline instance of one `CompilationRun`.
//!
//! ## Components
//!
//! | Class             | Description                                  |
//! |-------------------|----------------------------------------------|
//! | `ModuleJob`       | One module to compile                        |
//! | `BuildQueue`      | Thread-safe queue of ready jobs              |
//! | `BuildStats`      | Counters of the current build                |
//! | `DependencyGraph` | Import ordering of the modules               |
//! | `ParallelBuilder` | Orchestrates assembly and parallel compiles  |
//!
//! ## Build Pipeline
//!
//! ```text
//! assemble all → import graph → cycle check → parallel compile → report
//! ```
//!
//! A module is compiled once every module it imports has been compiled.
//! When a module fails, every module importing it (transitively) is
//! skipped; unrelated modules still build.

#ifndef A2C_DRIVER_PARALLEL_BUILDER_HPP
#define A2C_DRIVER_PARALLEL_BUILDER_HPP

#include "codegen/artifact_writer.hpp"
#include "driver/compilation_run.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace a2c::driver {

enum class ModuleStatus {
    Pending,
    Built,
    Failed,  ///< The module's own pipeline reported an error
    Skipped, ///< A module it imports failed
};

[[nodiscard]] auto module_status_name(ModuleStatus status) -> const char*;

/**
 * One module of a build
 */
struct ModuleJob {
    std::string module;
    tree::ModuleUnit unit;                 // Assembled unit, moved into the run
    std::vector<std::string> dependencies; // Imported module names
    ModuleStatus status = ModuleStatus::Pending;
    std::optional<diag::Diagnostic> error;
    std::string blocked_by; // Failed import that caused a skip
    Rc<ModuleOutput> output;
    std::optional<codegen::WrittenArtifacts> written;
};

/**
 * Build statistics for reporting
 */
struct BuildStats {
    std::atomic<int> total{0};
    std::atomic<int> built{0};
    std::atomic<int> failed{0};
    std::atomic<int> skipped{0};

    void reset() {
        total = 0;
        built = 0;
        failed = 0;
        skipped = 0;
    }

    [[nodiscard]] auto finished() const -> int {
        return built + failed + skipped;
    }
};

/**
 * Thread-safe work queue for parallel builds
 */
class BuildQueue {
public:
    void push(std::shared_ptr<ModuleJob> job);
    auto pop(int timeout_ms = 100) -> std::shared_ptr<ModuleJob>;
    void stop();
    auto is_empty() -> bool;

private:
    std::queue<std::shared_ptr<ModuleJob>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_flag_ = false;
};

/**
 * Import graph of the modules of one build
 */
class DependencyGraph {
public:
    // Add a module with the modules it imports
    void add_module(const std::string& module, const std::vector<std::string>& deps);

    // Modules whose imports are all built, in name order
    [[nodiscard]] auto ready_modules() const -> std::vector<std::string>;

    // Mark a module as built; returns the dependents that became ready
    auto mark_complete(const std::string& module) -> std::vector<std::string>;

    // Every module that imports `module`, directly or not, in name order
    [[nodiscard]] auto dependents_of(const std::string& module) const -> std::vector<std::string>;

    // First import cycle found, closed (`a, b, a`), if any
    [[nodiscard]] auto find_cycle() const -> std::optional<std::vector<std::string>>;

    [[nodiscard]] auto has_cycles() const -> bool {
        return find_cycle().has_value();
    }

    // Modules in an order where imports come first
    [[nodiscard]] auto topological_sort() const -> std::vector<std::string>;

private:
    std::map<std::string, std::vector<std::string>> deps_;        // module -> imports
    std::map<std::string, std::vector<std::string>> rdeps_;       // module -> importers
    std::unordered_map<std::string, int> pending_count_;          // unbuilt imports
    std::unordered_set<std::string> completed_;
    mutable std::mutex mutex_;
};

/// Outcome of one module, as reported by `ParallelBuilder::build`.
struct ModuleResult {
    std::string module;
    ModuleStatus status = ModuleStatus::Pending;
    std::optional<diag::Diagnostic> error; ///< Set for `Failed`
    std::string blocked_by;                ///< Failed import, set for `Skipped`
    Rc<ModuleOutput> output;               ///< Set for `Built`
    std::optional<codegen::WrittenArtifacts> written;
};

struct BuildReport {
    std::vector<ModuleResult> modules; ///< Sorted by module name

    [[nodiscard]] auto success() const -> bool;
    [[nodiscard]] auto count(ModuleStatus status) const -> size_t;
    [[nodiscard]] auto find(const std::string& module) const -> const ModuleResult*;
};

/**
 * Parallel build orchestrator
 * Compiles the modules of a fragment provider on a pool of worker threads
 */
class ParallelBuilder {
public:
    /// `num_threads` of 0 uses the hardware concurrency.
    explicit ParallelBuilder(CompilationRun& run, int num_threads = 0);

    /// Writes each built module's artifacts into `dir`.
    void set_output_dir(std::filesystem::path dir) {
        output_dir_ = std::move(dir);
    }

    /// Builds `modules` and every module they import; all modules of the
    /// provider when `modules` is empty.
    ///
    /// Fails as a whole only on an import cycle. Per-module errors are
    /// reported in the result.
    [[nodiscard]] auto build(const assemble::FragmentProvider& provider,
                             const std::vector<std::string>& modules = {})
        -> Result<BuildReport, diag::Diagnostic>;

    [[nodiscard]] auto stats() const -> const BuildStats& {
        return stats_;
    }

    [[nodiscard]] auto num_threads() const -> int {
        return num_threads_;
    }

private:
    CompilationRun& run_;
    int num_threads_;
    std::optional<std::filesystem::path> output_dir_;
    std::map<std::string, std::shared_ptr<ModuleJob>> jobs_;
    Box<BuildQueue> ready_queue_;
    BuildStats stats_;
    Box<DependencyGraph> dep_graph_;
    std::mutex job_mutex_;

    // Assembles every requested module and its imports into jobs
    void collect_jobs(const assemble::FragmentProvider& provider,
                      const std::vector<std::string>& modules);

    void worker_thread();

    // Runs the pipeline of one job; imports are already built
    void compile_job(ModuleJob& job);

    // Queues dependents that became ready
    void notify_dependents(const ModuleJob& job);

    // Marks every transitive dependent of a failed job as skipped
    void skip_dependents(const ModuleJob& job);

    [[nodiscard]] auto make_report() const -> BuildReport;

    // Marks a job failed before compiling (assembly or missing import)
    void fail_early(ModuleJob& job, diag::Diagnostic error);
};

} // namespace a2c::driver

#endif // A2C_DRIVER_PARALLEL_BUILDER_HPP
