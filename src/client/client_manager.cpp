#include "mcphub/client/client_manager.hpp"
#include "mcphub/async/settle_all.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/transport/process_transport.hpp"
#include "mcphub/transport/remote_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <iterator>

namespace mcphub {

namespace {

std::string describe_endpoint(const ServerConfig& config) {
    if (config.kind == TransportKind::Remote) {
        return config.url;
    }
    std::string text = config.command;
    for (const auto& arg : config.args) {
        text += " " + arg;
    }
    return text;
}

bool is_list_changed(const std::string& method) {
    return method == "notifications/tools/list_changed"
        || method == "notifications/resources/list_changed"
        || method == "notifications/prompts/list_changed";
}

void log_discovery_failure(const std::string& server_id, std::string_view method, const ClientError& error) {
    // Servers that do not implement a category answer -32601.
    if (error.code == ClientErrorCode::RpcError) {
        MCPHUB_LOG_DEBUG("[{}] {} not available: {}", server_id, method, error.message);
    } else {
        MCPHUB_LOG_WARN("[{}] {} failed: {}", server_id, method, error.message);
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Status & Options
// ═══════════════════════════════════════════════════════════════════════════

Json ServerStatus::to_json() const {
    return Json{
        {"id", id},
        {"kind", std::string(to_string(kind))},
        {"state", std::string(to_string(state))},
        {"connected", connected},
        {"tools", tool_count},
        {"resources", resource_count},
        {"prompts", prompt_count},
        {"endpoint", endpoint},
        {"lastError", last_error ? Json(*last_error) : Json(nullptr)}
    };
}

TransportFactory make_default_transport_factory(std::chrono::milliseconds shutdown_grace) {
    return [shutdown_grace](asio::any_io_executor executor, const ServerConfig& server)
        -> ClientResult<std::unique_ptr<ITransport>> {
        switch (server.kind) {
            case TransportKind::Process: {
                ProcessTransportConfig config;
                config.command = server.command;
                config.args = server.args;
                config.env = server.env;
                config.shutdown_grace = shutdown_grace;
                config.label = server.id;
                return std::unique_ptr<ITransport>(
                    std::make_unique<ProcessTransport>(std::move(executor), std::move(config)));
            }
            case TransportKind::Remote: {
                RemoteTransportConfig config;
                config.url = server.url;
                for (const auto& [name, value] : server.headers) {
                    set_header(config.headers, name, value);
                }
                config.request_timeout = server.timeout;
                config.label = server.id;
                return std::unique_ptr<ITransport>(
                    std::make_unique<RemoteTransport>(std::move(executor), std::move(config)));
            }
        }
        return tl::unexpected(ClientError::config_error("Unsupported transport kind").on_server(server.id));
    };
}

ManagerOptions ManagerOptions::from_settings(const HubSettings& settings) {
    ManagerOptions options;
    options.client_name = settings.client_name;
    options.client_version = settings.client_version;
    options.transport_factory = make_default_transport_factory(settings.shutdown_grace);
    return options;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<ClientManager> ClientManager::create(
    asio::any_io_executor executor,
    std::vector<ServerConfig> servers,
    ManagerOptions options
) {
    return std::shared_ptr<ClientManager>(
        new ClientManager(std::move(executor), std::move(servers), std::move(options)));
}

ClientManager::ClientManager(
    asio::any_io_executor executor,
    std::vector<ServerConfig> servers,
    ManagerOptions options
)
    : executor_(std::move(executor))
    , options_(std::move(options))
    , configs_(std::move(servers))
    , snapshot_(std::make_shared<const CatalogSnapshot>())
{
    if (!options_.transport_factory) {
        options_.transport_factory = make_default_transport_factory();
    }

    entries_.reserve(configs_.size());
    for (const auto& config : configs_) {
        ServerEntry entry;
        entry.config = config;
        entries_.push_back(std::move(entry));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ClientManager::initialize() {
    auto self = shared_from_this();

    auto expected = Lifecycle::Idle;
    if (lifecycle_.compare_exchange_strong(expected, Lifecycle::Starting) == false) {
        MCPHUB_LOG_DEBUG("initialize() ignored, manager is not idle");
        co_return;
    }

    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        epoch = epoch_;
    }

    MCPHUB_LOG_INFO("Connecting to {} server(s)", configs_.size());

    std::vector<asio::awaitable<void>> attempts;
    attempts.reserve(configs_.size());
    for (std::size_t i = 0; i < configs_.size(); ++i) {
        attempts.push_back(connect_server(i, epoch));
    }
    co_await settle_all(executor_, std::move(attempts));

    publish();

    auto starting = Lifecycle::Starting;
    if (lifecycle_.compare_exchange_strong(starting, Lifecycle::Running) == false) {
        // shutdown() ran while the attempts were in flight.
        publish();
        co_return;
    }

    const auto statuses = get_server_status();
    const auto connected = std::count_if(statuses.begin(), statuses.end(),
                                         [](const ServerStatus& s) { return s.connected; });
    const auto tool_count = snapshot()->tools().size();

    MCPHUB_LOG_INFO("{} of {} server(s) connected, {} tool(s) available",
                    connected, statuses.size(), tool_count);

    emit({ManagerEventKind::Initialized, "",
          std::to_string(connected) + " of " + std::to_string(statuses.size()) + " servers connected",
          "", Json()});
}

asio::awaitable<void> ClientManager::shutdown() {
    auto self = shared_from_this();

    auto current = lifecycle_.load();
    do {
        if (current == Lifecycle::Idle || current == Lifecycle::Stopping) {
            co_return;
        }
    } while (lifecycle_.compare_exchange_weak(current, Lifecycle::Stopping) == false);

    std::vector<std::shared_ptr<ServerConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        ++epoch_;
        for (auto& entry : entries_) {
            if (entry.connection) {
                connections.push_back(std::move(entry.connection));
                entry.connection.reset();
            }
            entry.released_state = ConnectionState::Disconnected;
            entry.catalog = {};
        }
    }

    MCPHUB_LOG_INFO("Shutting down {} connection(s)", connections.size());

    std::vector<asio::awaitable<void>> disconnects;
    disconnects.reserve(connections.size());
    for (const auto& connection : connections) {
        disconnects.push_back(connection->disconnect());
    }
    co_await settle_all(executor_, std::move(disconnects));

    const bool changed = publish();
    lifecycle_ = Lifecycle::Idle;

    if (changed) {
        emit({ManagerEventKind::RegistryChanged, "", "", "", Json()});
    }
    MCPHUB_LOG_INFO("Client manager stopped");
}

asio::awaitable<ClientResult<void>> ClientManager::reconnect(std::string server_id) {
    auto self = shared_from_this();

    if (lifecycle_ != Lifecycle::Running) {
        co_return tl::unexpected(ClientError::server_unavailable("Client manager is not running"));
    }

    const auto index = index_of(server_id);
    if (!index) {
        co_return tl::unexpected(ClientError::config_error("Unknown server: " + server_id));
    }

    std::shared_ptr<ServerConnection> previous;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[*index];
        if (entry.reconnecting) {
            co_return tl::unexpected(
                ClientError::busy("Reconnect already in progress").on_server(server_id));
        }
        entry.reconnecting = true;
        previous = std::move(entry.connection);
        entry.connection.reset();
        entry.released_state = ConnectionState::Disconnected;
        entry.catalog = {};
        epoch = epoch_;
    }

    MCPHUB_LOG_INFO("[{}] reconnecting", server_id);

    if (previous) {
        co_await previous->disconnect();
    }
    if (publish()) {
        emit({ManagerEventKind::RegistryChanged, "", "", "", Json()});
    }

    co_await connect_server(*index, epoch);

    ClientResult<void> outcome;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[*index];
        entry.reconnecting = false;
        if (!entry.connection || entry.connection->is_connected() == false) {
            outcome = tl::unexpected(ClientError::server_unavailable(
                entry.last_error.value_or("Reconnect failed")).on_server(server_id));
        }
    }

    if (publish()) {
        emit({ManagerEventKind::RegistryChanged, "", "", "", Json()});
    }
    co_return outcome;
}

bool ClientManager::is_running() const noexcept {
    return lifecycle_.load() == Lifecycle::Running;
}

// ═══════════════════════════════════════════════════════════════════════════
// Connect & Discover
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ClientManager::connect_server(std::size_t index, std::uint64_t epoch) {
    const ServerConfig& config = configs_[index];

    auto transport = options_.transport_factory(executor_, config);
    if (!transport) {
        MCPHUB_LOG_ERROR("[{}] cannot create transport: {}", config.id, transport.error().message);
        record_failure(index, nullptr, transport.error());
        co_return;
    }

    ConnectionOptions connection_options;
    connection_options.client_name = options_.client_name;
    connection_options.client_version = options_.client_version;
    connection_options.request_timeout = config.timeout;
    connection_options.max_list_pages = options_.max_list_pages;

    auto connection = ServerConnection::create(config.id, std::move(*transport), connection_options);
    wire_handlers(connection);

    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        if (epoch_ != epoch) {
            MCPHUB_LOG_DEBUG("[{}] connect abandoned, manager is shutting down", config.id);
            co_return;
        }
        auto& entry = entries_[index];
        entry.connection = connection;
        entry.last_error.reset();
        entry.catalog = {};
    }

    auto init = co_await connection->connect();
    if (!init) {
        record_failure(index, connection, init.error());
        co_return;
    }

    auto catalog = co_await discover(connection);

    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[index];
        if (entry.connection != connection) {
            co_return;  // superseded by shutdown or reconnect
        }
        MCPHUB_LOG_INFO("[{}] {} tool(s), {} resource(s), {} prompt(s)",
                        config.id, catalog.tools.size(), catalog.resources.size(), catalog.prompts.size());
        entry.catalog = std::move(catalog);
    }
}

void ClientManager::record_failure(
    std::size_t index,
    const std::shared_ptr<ServerConnection>& connection,
    const ClientError& error
) {
    const std::string& server_id = configs_[index].id;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[index];
        if (entry.connection != connection) {
            return;
        }
        entry.last_error = error.message;
        entry.released_state = connection ? connection->state() : ConnectionState::Failed;
        entry.connection.reset();
        entry.catalog = {};
    }

    emit({ManagerEventKind::ServerError, server_id, error.message, "", Json()});
}

asio::awaitable<ServerCatalog> ClientManager::discover(std::shared_ptr<ServerConnection> connection) {
    auto catalog = std::make_shared<ServerCatalog>();

    // Each listing writes only its own member of the catalog.
    std::vector<asio::awaitable<void>> listings;
    listings.push_back(discover_tools(connection, catalog));
    listings.push_back(discover_resources(connection, catalog));
    listings.push_back(discover_prompts(connection, catalog));
    co_await settle_all(executor_, std::move(listings));

    co_return std::move(*catalog);
}

asio::awaitable<void> ClientManager::discover_tools(
    std::shared_ptr<ServerConnection> connection,
    std::shared_ptr<ServerCatalog> catalog
) {
    auto tools = co_await connection->list_tools();
    if (!tools) {
        log_discovery_failure(connection->id(), "tools/list", tools.error());
        co_return;
    }
    catalog->tools = std::move(*tools);
}

asio::awaitable<void> ClientManager::discover_resources(
    std::shared_ptr<ServerConnection> connection,
    std::shared_ptr<ServerCatalog> catalog
) {
    auto resources = co_await connection->list_resources();
    if (!resources) {
        log_discovery_failure(connection->id(), "resources/list", resources.error());
        co_return;
    }
    catalog->resources = std::move(*resources);
}

asio::awaitable<void> ClientManager::discover_prompts(
    std::shared_ptr<ServerConnection> connection,
    std::shared_ptr<ServerCatalog> catalog
) {
    auto prompts = co_await connection->list_prompts();
    if (!prompts) {
        log_discovery_failure(connection->id(), "prompts/list", prompts.error());
        co_return;
    }
    catalog->prompts = std::move(*prompts);
}

asio::awaitable<void> ClientManager::rediscover(
    [[maybe_unused]] std::shared_ptr<ClientManager> self,
    std::string server_id,
    std::shared_ptr<ServerConnection> connection
) {
    // `self` keeps the manager alive for the detached pass.
    MCPHUB_LOG_DEBUG("[{}] catalog changed, rediscovering", server_id);

    auto catalog = co_await discover(connection);

    const auto index = index_of(server_id);
    if (!index) {
        co_return;
    }
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[*index];
        if (entry.connection != connection) {
            co_return;
        }
        entry.catalog = std::move(catalog);
    }

    if (publish()) {
        emit({ManagerEventKind::RegistryChanged, "", "", "", Json()});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Events
// ═══════════════════════════════════════════════════════════════════════════

void ClientManager::wire_handlers(const std::shared_ptr<ServerConnection>& connection) {
    std::weak_ptr<ClientManager> weak = weak_from_this();
    std::weak_ptr<ServerConnection> source = connection;
    const std::string server_id = connection->id();

    connection->on_notification([weak, source, server_id](const std::string& method, const Json& params) {
        if (auto self = weak.lock()) {
            self->handle_notification(server_id, source, method, params);
        }
    });

    connection->on_closed([weak, source, server_id](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->handle_closed(server_id, source, reason);
        }
    });
}

void ClientManager::handle_notification(
    const std::string& server_id,
    const std::weak_ptr<ServerConnection>& source,
    const std::string& method,
    const Json& params
) {
    if (is_list_changed(method)) {
        auto connection = source.lock();
        if (connection && is_running()) {
            asio::co_spawn(executor_,
                           rediscover(shared_from_this(), server_id, std::move(connection)),
                           asio::detached);
        }
        return;
    }

    emit({ManagerEventKind::ServerMessage, server_id, "", method, params});
}

void ClientManager::handle_closed(
    const std::string& server_id,
    const std::weak_ptr<ServerConnection>& source,
    const std::string& reason
) {
    auto connection = source.lock();
    const auto index = index_of(server_id);
    if (!connection || !index) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto& entry = entries_[*index];
        if (entry.connection != connection) {
            return;
        }
        entry.connection.reset();
        entry.released_state = ConnectionState::Disconnected;
        entry.catalog = {};
        entry.last_error = reason;
    }

    MCPHUB_LOG_WARN("[{}] disconnected: {}", server_id, reason);

    // Releases the transport; the connection is gone once this completes.
    asio::co_spawn(executor_, connection->disconnect(), asio::detached);

    emit({ManagerEventKind::ServerDisconnected, server_id, reason, "", Json()});
    if (publish()) {
        emit({ManagerEventKind::RegistryChanged, "", "", "", Json()});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Invocation
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> ClientManager::call_tool(std::string name, Json arguments) {
    auto self = shared_from_this();

    if (is_running() == false) {
        co_return tl::unexpected(ClientError::server_unavailable("Client manager is not running"));
    }

    const auto catalog = snapshot();
    const auto* tool = catalog->find_tool(name);
    if (tool == nullptr) {
        co_return tl::unexpected(ClientError::tool_not_found(name));
    }

    const std::string server_id = tool->server_id;
    const std::string tool_name = tool->tool.name;

    auto target = connection(server_id);
    if (!target || target->is_connected() == false) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + server_id + " is not connected").on_server(server_id));
    }

    MCPHUB_LOG_DEBUG("Calling tool {} on {}", tool_name, server_id);
    co_return co_await target->call_tool(tool_name, std::move(arguments));
}

asio::awaitable<ClientResult<Json>> ClientManager::read_resource(std::string uri) {
    auto self = shared_from_this();

    if (is_running() == false) {
        co_return tl::unexpected(ClientError::server_unavailable("Client manager is not running"));
    }

    const auto catalog = snapshot();
    const auto* resource = catalog->find_resource(uri);
    if (resource == nullptr) {
        co_return tl::unexpected(ClientError::resource_not_found(uri));
    }

    const std::string server_id = resource->server_id;
    const std::string resource_uri = resource->resource.uri;

    auto target = connection(server_id);
    if (!target || target->is_connected() == false) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + server_id + " is not connected").on_server(server_id));
    }

    co_return co_await target->read_resource(resource_uri);
}

asio::awaitable<ClientResult<Json>> ClientManager::get_prompt(std::string name, Json arguments) {
    auto self = shared_from_this();

    if (is_running() == false) {
        co_return tl::unexpected(ClientError::server_unavailable("Client manager is not running"));
    }

    const auto catalog = snapshot();
    const auto* prompt = catalog->find_prompt(name);
    if (prompt == nullptr) {
        co_return tl::unexpected(ClientError::prompt_not_found(name));
    }

    const std::string server_id = prompt->server_id;
    const std::string prompt_name = prompt->prompt.name;

    auto target = connection(server_id);
    if (!target || target->is_connected() == false) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + server_id + " is not connected").on_server(server_id));
    }

    co_return co_await target->get_prompt(prompt_name, std::move(arguments));
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalog & Status
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<const CatalogSnapshot> ClientManager::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::vector<ToolDescriptor> ClientManager::get_available_tools() const {
    return snapshot()->tools();
}

std::vector<ResourceDescriptor> ClientManager::get_available_resources() const {
    return snapshot()->resources();
}

std::vector<PromptDescriptor> ClientManager::get_available_prompts() const {
    return snapshot()->prompts();
}

std::vector<ServerStatus> ClientManager::get_server_status() const {
    std::lock_guard<std::mutex> lock(entries_mutex_);

    std::vector<ServerStatus> statuses;
    statuses.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ServerStatus status;
        status.id = entry.config.id;
        status.kind = entry.config.kind;
        status.last_error = entry.last_error;

        if (entry.connection) {
            status.state = entry.connection->state();
            status.endpoint = entry.connection->endpoint();
            if (!status.last_error) {
                status.last_error = entry.connection->last_error();
            }
        } else {
            status.state = entry.released_state;
            status.endpoint = describe_endpoint(entry.config);
        }

        status.connected = (status.state == ConnectionState::Connected);
        status.tool_count = entry.catalog.tools.size();
        status.resource_count = entry.catalog.resources.size();
        status.prompt_count = entry.catalog.prompts.size();
        statuses.push_back(std::move(status));
    }
    return statuses;
}

std::shared_ptr<ServerConnection> ClientManager::connection(std::string_view server_id) const {
    const auto index = index_of(server_id);
    if (!index) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(entries_mutex_);
    return entries_[*index].connection;
}

bool ClientManager::publish() {
    // Both locks held: snapshots are swapped in the order they were built.
    std::lock_guard<std::mutex> entries_lock(entries_mutex_);

    std::vector<CatalogSnapshot::Source> sources;
    sources.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.catalog.empty() == false) {
            sources.emplace_back(entry.config.id, entry.catalog);
        }
    }
    auto next = std::make_shared<const CatalogSnapshot>(CatalogSnapshot::build(sources));

    std::lock_guard<std::mutex> snapshot_lock(snapshot_mutex_);
    const bool changed = (*next == *snapshot_) == false;
    snapshot_ = std::move(next);
    return changed;
}

std::optional<std::size_t> ClientManager::index_of(std::string_view server_id) const {
    const auto it = std::find_if(configs_.begin(), configs_.end(),
                                 [server_id](const ServerConfig& c) { return c.id == server_id; });
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(configs_.begin(), it));
}

// ═══════════════════════════════════════════════════════════════════════════
// Listeners
// ═══════════════════════════════════════════════════════════════════════════

ClientManager::ListenerId ClientManager::add_listener(ManagerListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const auto id = ++next_listener_id_;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ClientManager::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(id);
}

void ClientManager::emit(const ManagerEvent& event) {
    std::vector<ManagerListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            MCPHUB_LOG_ERROR("Listener for {} threw: {}", to_string(event.kind), e.what());
        }
    }
}

}  // namespace mcphub
