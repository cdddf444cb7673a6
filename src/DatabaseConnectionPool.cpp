#include "DatabaseConnectionPool.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

// ResultSet
ResultSet::~ResultSet()
{
    if (result_)
        mysql_free_result(result_);
}

ResultSet::ResultSet(ResultSet &&other) noexcept : result_(other.result_)
{
    other.result_ = nullptr;
}

ResultSet &ResultSet::operator=(ResultSet &&other) noexcept
{
    if (this != &other)
    {
        if (result_)
            mysql_free_result(result_);
        result_ = other.result_;
        other.result_ = nullptr;
    }
    return *this;
}

// PooledConnection
PooledConnection::PooledConnection(MYSQL *conn, DatabaseConnectionPool *pool)
    : connection_(conn), pool_(pool)
{
}

PooledConnection::~PooledConnection()
{
    if (connection_ && pool_)
        pool_->release(connection_);
}

PooledConnection::PooledConnection(PooledConnection &&other) noexcept
    : connection_(other.connection_), pool_(other.pool_), last_errno_(other.last_errno_)
{
    other.connection_ = nullptr;
    other.pool_ = nullptr;
}

PooledConnection &PooledConnection::operator=(PooledConnection &&other) noexcept
{
    if (this != &other)
    {
        if (connection_ && pool_)
            pool_->release(connection_);

        connection_ = other.connection_;
        pool_ = other.pool_;
        last_errno_ = other.last_errno_;

        other.connection_ = nullptr;
        other.pool_ = nullptr;
    }
    return *this;
}

bool PooledConnection::try_insert(const std::string &sql)
{
    if (mysql_query(connection_, sql.c_str()) == 0)
    {
        last_errno_ = 0;
        return true;
    }

    last_errno_ = mysql_errno(connection_);
    if (last_errno_ == duplicate_key_errno)
        return false;

    std::string message = mysql_error(connection_);
    std::cerr << "MySQL 执行失败: " << message << std::endl;
    throw StoreError("MySQL 执行失败: " + message);
}

unsigned long long PooledConnection::execute(const std::string &sql)
{
    if (mysql_query(connection_, sql.c_str()) != 0)
    {
        last_errno_ = mysql_errno(connection_);
        std::string message = mysql_error(connection_);
        std::cerr << "MySQL 执行失败: " << message << std::endl;
        throw StoreError("MySQL 执行失败: " + message);
    }
    last_errno_ = 0;
    return mysql_affected_rows(connection_);
}

ResultSet PooledConnection::query(const std::string &sql)
{
    if (mysql_query(connection_, sql.c_str()) != 0)
    {
        last_errno_ = mysql_errno(connection_);
        std::string message = mysql_error(connection_);
        std::cerr << "MySQL 查询失败: " << message << std::endl;
        throw StoreError("MySQL 查询失败: " + message);
    }

    MYSQL_RES *result = mysql_store_result(connection_);
    if (result == nullptr && mysql_field_count(connection_) != 0)
        throw StoreError("读取结果集失败: " + std::string(mysql_error(connection_)));

    last_errno_ = 0;
    return ResultSet(result);
}

std::string PooledConnection::quote(const std::string &value)
{
    std::string escaped(value.size() * 2 + 1, '\0');
    unsigned long length = mysql_real_escape_string(connection_, &escaped[0], value.c_str(),
                                                    static_cast<unsigned long>(value.size()));
    escaped.resize(length);
    return "'" + escaped + "'";
}

// Transaction
Transaction::Transaction(PooledConnection &conn) : conn_(conn)
{
    conn_.execute("START TRANSACTION");
}

Transaction::~Transaction()
{
    if (finished_)
        return;

    // 析构中不能抛出，回滚失败只记录
    if (mysql_query(conn_.get(), "ROLLBACK") != 0)
        std::cerr << "事务回滚失败: " << mysql_error(conn_.get()) << std::endl;
}

void Transaction::commit()
{
    conn_.execute("COMMIT");
    finished_ = true;
}

// DatabaseConnectionPool
DatabaseConnectionPool::DatabaseConnectionPool(const DatabaseConfig &db_config, const PoolConfig &pool_config)
    : db_config_(db_config), pool_config_(pool_config), initialized_(false), shutdown_requested_(false),
      active_connections_(0)
{
}

DatabaseConnectionPool::~DatabaseConnectionPool()
{
    shutdown();
}

bool DatabaseConnectionPool::initialize()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_)
        return true;

    shutdown_requested_ = false;
    for (size_t i = 0; i < pool_config_.initial_size; ++i)
    {
        MYSQL *conn = create_connection();
        if (!conn)
        {
            std::cerr << "创建初始数据库连接失败 (" << i + 1 << "/" << pool_config_.initial_size << ")" << std::endl;
            continue;
        }
        available_connections_.push(conn);
        connections_.push_back({conn, std::chrono::steady_clock::now()});
    }

    if (available_connections_.empty())
    {
        std::cerr << "无法建立任何数据库连接" << std::endl;
        return false;
    }

    initialized_ = true;
    cleanup_thread_ = std::thread(&DatabaseConnectionPool::cleanup_worker, this);

    std::cout << "数据库连接池已初始化，连接数: " << available_connections_.size() << std::endl;
    return true;
}

PooledConnection DatabaseConnectionPool::acquire()
{
    if (!initialized_)
        throw StoreError("数据库连接池未初始化");

    std::unique_lock<std::mutex> lock(mutex_);

    // 没有空闲连接但未达上限时直接新建
    if (available_connections_.empty() && connections_.size() < pool_config_.max_size)
    {
        MYSQL *conn = create_connection();
        if (conn)
        {
            connections_.push_back({conn, std::chrono::steady_clock::now()});
            active_connections_++;
            return PooledConnection(conn, this);
        }
    }

    auto timeout = std::chrono::milliseconds(pool_config_.wait_timeout);
    if (!condition_.wait_for(lock, timeout, [this]
                             { return !available_connections_.empty() || shutdown_requested_; }))
    {
        throw StoreError("等待数据库连接超时");
    }

    if (shutdown_requested_)
        throw StoreError("数据库连接池已关闭");

    MYSQL *connection = available_connections_.front();
    available_connections_.pop();

    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [connection](const ConnectionInfo &info)
                           { return info.connection == connection; });

    if (!is_connection_valid(connection))
    {
        // 断开的连接换成新连接
        destroy_connection(connection);
        connection = create_connection();
        if (!connection)
        {
            if (it != connections_.end())
                connections_.erase(it);
            throw StoreError("重建数据库连接失败");
        }
        if (it != connections_.end())
            it->connection = connection;
    }

    if (it != connections_.end())
        it->last_used = std::chrono::steady_clock::now();

    active_connections_++;
    return PooledConnection(connection, this);
}

void DatabaseConnectionPool::release(MYSQL *connection)
{
    if (!connection)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    active_connections_--;

    if (shutdown_requested_)
    {
        auto it = std::find_if(connections_.begin(), connections_.end(),
                               [connection](const ConnectionInfo &info)
                               { return info.connection == connection; });
        if (it != connections_.end())
            connections_.erase(it);
        destroy_connection(connection);
        return;
    }

    available_connections_.push(connection);
    condition_.notify_one();
}

void DatabaseConnectionPool::shutdown()
{
    if (!initialized_)
        return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_requested_ = true;
    }
    condition_.notify_all();
    cleanup_condition_.notify_all();

    if (cleanup_thread_.joinable())
        cleanup_thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);

    // 只销毁空闲连接；借出中的连接在归还时销毁
    while (!available_connections_.empty())
    {
        MYSQL *conn = available_connections_.front();
        available_connections_.pop();
        auto it = std::find_if(connections_.begin(), connections_.end(),
                               [conn](const ConnectionInfo &info)
                               { return info.connection == conn; });
        if (it != connections_.end())
            connections_.erase(it);
        destroy_connection(conn);
    }

    initialized_ = false;
    std::cout << "数据库连接池已关闭" << std::endl;
}

std::string DatabaseConnectionPool::get_status() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::stringstream ss;
    ss << "连接池状态:" << std::endl;
    ss << "  总连接数: " << connections_.size() << std::endl;
    ss << "  空闲连接: " << available_connections_.size() << std::endl;
    ss << "  使用中: " << active_connections_ << std::endl;
    ss << "  上限: " << pool_config_.max_size << std::endl;
    return ss.str();
}

void DatabaseConnectionPool::cleanup_idle_connections()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_requested_ || !initialized_)
        return;

    auto now = std::chrono::steady_clock::now();
    auto idle_threshold = std::chrono::seconds(pool_config_.max_idle_time);

    std::queue<MYSQL *> kept;
    while (!available_connections_.empty())
    {
        MYSQL *conn = available_connections_.front();
        available_connections_.pop();

        auto it = std::find_if(connections_.begin(), connections_.end(),
                               [conn](const ConnectionInfo &info)
                               { return info.connection == conn; });
        bool idle = it != connections_.end() && now - it->last_used > idle_threshold;
        if (idle && connections_.size() > pool_config_.initial_size)
        {
            connections_.erase(it);
            destroy_connection(conn);
        }
        else
        {
            kept.push(conn);
        }
    }
    available_connections_ = std::move(kept);

    while (connections_.size() < pool_config_.initial_size)
    {
        MYSQL *conn = create_connection();
        if (!conn)
            break;
        available_connections_.push(conn);
        connections_.push_back({conn, std::chrono::steady_clock::now()});
    }
}

void DatabaseConnectionPool::cleanup_worker()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_requested_)
    {
        cleanup_condition_.wait_for(lock, std::chrono::minutes(1), [this]
                                    { return shutdown_requested_.load(); });
        if (shutdown_requested_)
            break;

        lock.unlock();
        cleanup_idle_connections();
        lock.lock();
    }
}

MYSQL *DatabaseConnectionPool::create_connection()
{
    MYSQL *conn = mysql_init(nullptr);
    if (!conn)
    {
        std::cerr << "mysql_init() 失败" << std::endl;
        return nullptr;
    }

    unsigned int connect_timeout = static_cast<unsigned int>(db_config_.connection_timeout);
    unsigned int read_timeout = static_cast<unsigned int>(db_config_.read_timeout);
    unsigned int write_timeout = static_cast<unsigned int>(db_config_.write_timeout);
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &read_timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout);

    if (mysql_real_connect(conn, db_config_.host.c_str(), db_config_.user.c_str(),
                           db_config_.password.c_str(), db_config_.database.c_str(),
                           db_config_.port, nullptr, CLIENT_FOUND_ROWS) == nullptr)
    {
        std::cerr << "mysql_real_connect() 失败: " << mysql_error(conn) << std::endl;
        mysql_close(conn);
        return nullptr;
    }

    if (mysql_set_character_set(conn, db_config_.charset.c_str()))
    {
        std::cerr << "设置字符集失败: " << mysql_error(conn) << std::endl;
        mysql_close(conn);
        return nullptr;
    }

    return conn;
}

void DatabaseConnectionPool::destroy_connection(MYSQL *connection)
{
    if (connection)
        mysql_close(connection);
}

bool DatabaseConnectionPool::is_connection_valid(MYSQL *connection)
{
    return connection && mysql_ping(connection) == 0;
}
