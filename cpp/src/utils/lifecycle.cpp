/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 * @see include/utils/module_def.hpp (for MAX_MODULE_NAME_LEN)
 *
 * **Implementation Details**
 *
 * 1.  **Static Initialization**: `initialize()` builds a graph from the registered
 *     modules and starts them in topological order. This happens once.
 *
 * 2.  **Fail fast**: a duplicate name, an undefined dependency, a cycle, or a startup
 *     callback that throws leaves the process with no consistent set of services, so
 *     all of them abort with a module status report.
 *
 * 3.  **Timed Shutdown**: shutdown callbacks run with real timeouts using
 *     thread+flag+poll+detach (not std::async, whose destructor blocks even after
 *     wait_for returns timeout).
 ******************************************************************************/
#include "fbr_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"
#include <chrono>
#include <cstdint>
#include <fmt/ranges.h> // For fmt::join on vectors
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
/**
 * @brief Validates a module name: non-empty, within MAX_MODULE_NAME_LEN.
 * @throws std::invalid_argument if `name` is empty.
 * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
 */
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > filebridge::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(filebridge::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;              ///< callback completed without throwing
    bool timed_out;            ///< callback did not complete within the deadline
    std::string exception_msg; ///< non-empty if the callback threw
};

/**
 * @brief Runs `func` on a thread with a real deadline. Returns without blocking
 *        beyond the deadline even if `func` hangs (the thread is detached on timeout).
 *
 * The detached thread keeps its own copies of the callback and the completion flag,
 * so nothing it touches goes out of scope when we stop waiting for it.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    struct SharedState
    {
        std::atomic<bool> completed{false};
        std::string error;
    };
    auto state = std::make_shared<SharedState>();

    std::thread thread(
        [func, state]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                state->error = e.what();
                if (state->error.empty())
                {
                    state->error = "exception with empty message";
                }
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }

    thread.join();
    if (!state->error.empty())
    {
        return {false, false, state->error};
    }
    return {true, false, {}};
}

constexpr size_t kDebugInfoReserveBytes = 4096;

} // namespace

namespace filebridge::utils::lifecycle_internal
{
struct InternalModuleShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    InternalModuleShutdownDef shutdown;
};
} // namespace filebridge::utils::lifecycle_internal

namespace filebridge::utils
{
class ModuleDefImpl
{
  public:
    lifecycle_internal::InternalModuleDef def;
};

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: shutdown argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.shutdown.func = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(filebridge::platform::get_pid()),
          m_app_name(filebridge::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout ///< Shutdown callback did not complete within timeout; thread was detached.
    };

    struct InternalGraphNode
    {
        InternalGraphNode(lifecycle_internal::InternalModuleDef def)
            : name(std::move(def.name)), startup(std::move(def.startup)),
              shutdown(std::move(def.shutdown)), dependencies(std::move(def.dependencies))
        {
        }

        std::string name;
        std::function<void()> startup;
        lifecycle_internal::InternalModuleShutdownDef shutdown;
        std::vector<std::string> dependencies;
        std::vector<InternalGraphNode *> dependents;
        std::atomic<ModuleStatus> status = {ModuleStatus::Registered};
    };

    void registerStaticModule(lifecycle_internal::InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    bool isModuleStarted(std::string_view name);

    std::atomic<bool> m_is_initialized = {false};
    std::atomic<bool> m_is_finalized = {false};

  private:
    void buildStaticGraph();
    static std::vector<InternalGraphNode *>
    topologicalSort(const std::vector<InternalGraphNode *> &nodes);
    static void shutdownModuleWithTimeout(InternalGraphNode &mod, std::string &debug_info);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    static const char *statusToString(ModuleStatus status);

    const uint64_t m_pid;
    const std::string m_app_name;
    std::mutex m_registry_mutex; // Protects m_registered_modules and m_module_graph
    std::vector<lifecycle_internal::InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode, std::less<>> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
};

void LifecycleManagerImpl::registerStaticModule(lifecycle_internal::InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        FBR_PANIC("[FBR_LifeCycle]\nEXEC[{}]:PID[{}]\n  "
                  "    **  FATAL: register_module('{}') called after initialization.",
                  m_app_name, m_pid, def.name);
    }
    m_registered_modules.push_back(std::move(def));
}

/**
 * @brief Builds the graph, sorts it and runs every startup callback in order.
 *        Any failure here aborts the application.
 */
void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);

    debug_info += fmt::format("[FBR_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              filebridge::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildStaticGraph();
        std::vector<InternalGraphNode *> nodes;
        nodes.reserve(m_module_graph.size());
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        try
        {
            debug_info += fmt::format("     -> Starting module: '{}'...", mod->name);
            mod->status.store(ModuleStatus::Initializing, std::memory_order_release);
            if (mod->startup)
            {
                mod->startup();
            }
            mod->status.store(ModuleStatus::Started, std::memory_order_release);
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status.store(ModuleStatus::Failed, std::memory_order_release);
            FBR_DEBUG("{}", debug_info);
            printStatusAndAbort("\n     **** Exception during startup: " + std::string(e.what()),
                                mod->name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    FBR_DEBUG("{}", debug_info);
}

/**
 * @brief Shuts down started modules in reverse startup order, each bounded by its
 *        own timeout. Modules that failed or never started are skipped.
 */
void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info +=
        fmt::format("[FBR_LifeCycle] [{}]:PID[{}]\n"
                    "     **** finalize() called, associated with a constructor from {} ({}:{}):\n"
                    "     <- Finalizing application...\n",
                    m_app_name, m_pid, loc.function_name(),
                    filebridge::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        InternalGraphNode &mod = **it;
        if (mod.status.load(std::memory_order_acquire) != ModuleStatus::Started)
        {
            continue;
        }
        shutdownModuleWithTimeout(mod, debug_info);
    }
    debug_info += "     <- Application finalization complete.\n";
    FBR_DEBUG("{}", debug_info);
}

bool LifecycleManagerImpl::isModuleStarted(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto iter = m_module_graph.find(name);
    return iter != m_module_graph.end() &&
           iter->second.status.load(std::memory_order_acquire) == ModuleStatus::Started;
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(InternalGraphNode &mod,
                                                     std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.name);

    auto outcome = timedShutdown(mod.shutdown.func, mod.shutdown.timeout);

    if (outcome.success)
    {
        mod.status.store(ModuleStatus::Shutdown, std::memory_order_release);
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status.store(ModuleStatus::ShutdownTimeout, std::memory_order_release);
        debug_info +=
            fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.shutdown.timeout.count());
        fmt::print(stderr, "[FBR_LifeCycle] WARNING: shutdown of '{}' timed out after {}ms.\n",
                   mod.name, mod.shutdown.timeout.count());
    }
    else
    {
        mod.status.store(ModuleStatus::FailedShutdown, std::memory_order_release);
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.name, outcome.exception_msg);
        fmt::print(stderr, "[FBR_LifeCycle] ERROR: module '{}' threw on shutdown: {}\n", mod.name,
                   outcome.exception_msg);
    }
}

/**
 * @brief Constructs the dependency graph from the registered modules.
 * @throws std::runtime_error on a duplicate module name or an undefined dependency.
 */
void LifecycleManagerImpl::buildStaticGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        std::string key = def.name;
        m_module_graph.emplace(std::piecewise_construct, std::forward_as_tuple(std::move(key)),
                               std::forward_as_tuple(std::move(def)));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name + " (required by " +
                                         entry.first + ")");
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the given nodes.
 * @throws std::runtime_error If a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<InternalGraphNode *> &nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

const char *LifecycleManagerImpl::statusToString(ModuleStatus status)
{
    switch (status)
    {
    case ModuleStatus::Registered:
        return "Registered";
    case ModuleStatus::Initializing:
        return "Initializing";
    case ModuleStatus::Started:
        return "Started";
    case ModuleStatus::Failed:
        return "Failed";
    case ModuleStatus::Shutdown:
        return "Shutdown";
    case ModuleStatus::FailedShutdown:
        return "FailedShutdown";
    case ModuleStatus::ShutdownTimeout:
        return "ShutdownTimeout";
    }
    return "Unknown";
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[FBR_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[FBR_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}' [{}]\n", name,
                   statusToString(node.status.load(std::memory_order_acquire)));
    }
    fmt::print(stderr, "---------------------\n\n");
    filebridge::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager public API (thin delegation layer)
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerStaticModule(std::move(def.pImpl->def));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_module_started(std::string_view name)
{
    return pImpl->isModuleStarted(name);
}

} // namespace filebridge::utils
