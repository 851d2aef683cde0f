#include "mcphub/integration/integration.hpp"
#include "mcphub/log/logger.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <iterator>

namespace mcphub {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    const auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    return std::format("{}.{:03}Z", std::string_view(buffer, length), millis);
}

// Clears the refresh flag on every exit path, including exceptions.
struct RefreshGuard {
    explicit RefreshGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RefreshGuard() { flag_ = false; }
    RefreshGuard(const RefreshGuard&) = delete;
    RefreshGuard& operator=(const RefreshGuard&) = delete;

    std::atomic<bool>& flag_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Value Types
// ═══════════════════════════════════════════════════════════════════════════

Json RegisteredTool::to_json() const {
    Json j = {
        {"name", name},
        {"id", qualified_id},
        {"server", server_id},
        {"inputSchema", input_schema}
    };
    if (description) {
        j["description"] = *description;
    }
    return j;
}

Json ToolCallRecord::to_json() const {
    return Json{
        {"timestamp", format_timestamp(timestamp)},
        {"tool", tool},
        {"args", arguments},
        {"success", success},
        {"error", error ? Json(*error) : Json(nullptr)},
        {"resultSize", result_size},
        {"durationMs", duration.count()}
    };
}

Json IntegrationStats::to_json() const {
    Json status = Json::array();
    for (const auto& server : servers) {
        status.push_back(server.to_json());
    }
    return Json{
        {"initialized", initialized},
        {"serverCount", server_count},
        {"connectedServers", connected_servers},
        {"toolCount", tool_count},
        {"resourceCount", resource_count},
        {"promptCount", prompt_count},
        {"totalCalls", total_calls},
        {"failedCalls", failed_calls},
        {"serverStatus", std::move(status)}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<Integration> Integration::create(
    std::shared_ptr<ClientManager> manager,
    IntegrationOptions options
) {
    auto integration = std::shared_ptr<Integration>(new Integration(std::move(manager), std::move(options)));

    std::weak_ptr<Integration> weak = integration;
    integration->listener_id_ = integration->manager_->add_listener([weak](const ManagerEvent& event) {
        if (auto self = weak.lock()) {
            self->handle_manager_event(event);
        }
    });
    return integration;
}

Integration::Integration(std::shared_ptr<ClientManager> manager, IntegrationOptions options)
    : manager_(std::move(manager))
    , options_(std::move(options))
{}

Integration::~Integration() {
    manager_->remove_listener(listener_id_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Integration::initialize() {
    auto self = shared_from_this();

    MCPHUB_LOG_INFO("Initializing integration ({} configured server(s))", manager_->servers().size());
    co_await manager_->initialize();

    initialized_ = true;
    rebuild_registry();
}

asio::awaitable<void> Integration::shutdown() {
    auto self = shared_from_this();

    co_await manager_->shutdown();

    initialized_ = false;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_.clear();
        registry_index_.clear();
    }
    MCPHUB_LOG_INFO("Integration shut down");
}

asio::awaitable<bool> Integration::refresh() {
    auto self = shared_from_this();

    bool expected = false;
    if (refreshing_.compare_exchange_strong(expected, true) == false) {
        MCPHUB_LOG_WARN("Refresh already in progress");
        co_return false;
    }
    RefreshGuard guard(refreshing_);

    MCPHUB_LOG_INFO("Refreshing server connections");
    co_await manager_->shutdown();
    co_await manager_->initialize();

    initialized_ = true;
    rebuild_registry();
    co_return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Invocation
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> Integration::call_tool(std::string name, Json arguments) {
    auto self = shared_from_this();
    const auto started = std::chrono::steady_clock::now();

    ClientResult<Json> result;
    if (refreshing_) {
        result = tl::unexpected(ClientError::busy("Refresh in progress, retry " + name + " later"));
    } else {
        result = co_await manager_->call_tool(name, arguments);
    }

    record_call(name, arguments, result, started);
    co_return result;
}

asio::awaitable<ClientResult<Json>> Integration::execute_tool(std::string name, Json arguments) {
    auto self = shared_from_this();

    if (refreshing_) {
        co_return tl::unexpected(ClientError::busy("Refresh in progress, retry " + name + " later"));
    }

    const auto tool = get_tool(name);
    if (!tool) {
        co_return tl::unexpected(ClientError::tool_not_found(name));
    }
    co_return co_await manager_->call_tool(tool->qualified_id, std::move(arguments));
}

void Integration::record_call(
    const std::string& tool,
    const Json& arguments,
    const ClientResult<Json>& result,
    std::chrono::steady_clock::time_point started
) {
    ToolCallRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.tool = tool;
    record.arguments = arguments.is_null() ? "{}" : arguments.dump();
    record.success = result.has_value();
    if (result) {
        record.result_size = result->dump().size();
    } else {
        record.error = result.error().describe();
    }
    record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (record.success) {
        MCPHUB_LOG_DEBUG("Tool call {} ok ({} bytes, {}ms)", tool, record.result_size, record.duration.count());
    } else {
        MCPHUB_LOG_WARN("Tool call {} failed: {}", tool, *record.error);
    }

    std::lock_guard<std::mutex> lock(log_mutex_);
    ++total_calls_;
    if (record.success == false) {
        ++failed_calls_;
    }
    if (options_.call_log_capacity == 0) {
        return;
    }
    while (call_log_.size() >= options_.call_log_capacity) {
        call_log_.pop_front();
    }
    call_log_.push_back(std::move(record));
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════════════

void Integration::rebuild_registry() {
    const auto catalog = manager_->snapshot();

    std::vector<RegisteredTool> registry;
    std::unordered_map<std::string, std::size_t> index;

    for (const auto& descriptor : catalog->tools()) {
        if (index.contains(descriptor.tool.name)) {
            MCPHUB_LOG_DEBUG("Tool name {} from {} shadowed by {}",
                             descriptor.tool.name, descriptor.server_id,
                             registry[index[descriptor.tool.name]].server_id);
            continue;
        }
        index.emplace(descriptor.tool.name, registry.size());
        registry.push_back(RegisteredTool{
            descriptor.tool.name,
            descriptor.qualified_id(),
            descriptor.server_id,
            descriptor.tool.description,
            descriptor.tool.input_schema
        });
    }

    const auto count = registry.size();
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_ = std::move(registry);
        registry_index_ = std::move(index);
    }
    MCPHUB_LOG_INFO("Registered {} tool(s)", count);
}

std::vector<RegisteredTool> Integration::get_tools() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_;
}

std::optional<RegisteredTool> Integration::get_tool(std::string_view name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    const auto it = registry_index_.find(std::string(name));
    if (it == registry_index_.end()) {
        return std::nullopt;
    }
    return registry_[it->second];
}

std::vector<std::string> Integration::get_tool_names() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& tool : registry_) {
        names.push_back(tool.name);
    }
    return names;
}

bool Integration::has_tool(std::string_view name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_index_.contains(std::string(name));
}

std::vector<RegisteredTool> Integration::get_high_priority_tools() const {
    const auto& priority = options_.priority_servers;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<RegisteredTool> tools;
    std::copy_if(registry_.begin(), registry_.end(), std::back_inserter(tools),
                 [&priority](const RegisteredTool& tool) {
                     return std::find(priority.begin(), priority.end(), tool.server_id) != priority.end();
                 });
    return tools;
}

std::vector<ResourceDescriptor> Integration::get_resources() const {
    return manager_->get_available_resources();
}

std::vector<ServerStatus> Integration::get_server_status() const {
    return manager_->get_server_status();
}

IntegrationStats Integration::get_stats() const {
    IntegrationStats stats;
    stats.initialized = initialized_;
    stats.servers = manager_->get_server_status();
    stats.server_count = stats.servers.size();
    stats.connected_servers = static_cast<std::size_t>(std::count_if(
        stats.servers.begin(), stats.servers.end(), [](const ServerStatus& s) { return s.connected; }));

    const auto catalog = manager_->snapshot();
    stats.resource_count = catalog->resources().size();
    stats.prompt_count = catalog->prompts().size();

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        stats.tool_count = registry_.size();
    }
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        stats.total_calls = total_calls_;
        stats.failed_calls = failed_calls_;
    }
    return stats;
}

std::vector<ToolCallRecord> Integration::call_log() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return {call_log_.begin(), call_log_.end()};
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

Integration::HandlerId Integration::on_event(HostEventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    const auto id = ++next_handler_id_;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void Integration::remove_handler(HandlerId id) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handlers_.erase(id);
}

void Integration::handle_manager_event(const ManagerEvent& event) {
    switch (event.kind) {
        case ManagerEventKind::Initialized:
        case ManagerEventKind::RegistryChanged: {
            rebuild_registry();
            std::size_t count = 0;
            {
                std::lock_guard<std::mutex> lock(registry_mutex_);
                count = registry_.size();
            }
            emit({HostEventKind::ToolsUpdated, "", "", count});
            break;
        }
        case ManagerEventKind::ServerError:
            emit({HostEventKind::ServerError, event.server_id, event.message, 0});
            break;
        case ManagerEventKind::ServerDisconnected:
            emit({HostEventKind::ServerDisconnected, event.server_id, event.message, 0});
            break;
        case ManagerEventKind::ServerMessage:
            MCPHUB_LOG_TRACE("[{}] {}", event.server_id, event.method);
            break;
    }
}

void Integration::emit(const HostEvent& event) {
    std::vector<HostEventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            MCPHUB_LOG_ERROR("Host handler for {} threw: {}", to_string(event.kind), e.what());
        }
    }
}

}  // namespace mcphub
