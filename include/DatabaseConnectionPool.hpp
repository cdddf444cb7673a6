#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <mysql/mysql.h>
#include "ConfigManager.hpp"
#include "OAuthTypes.hpp"

class DatabaseConnectionPool;

// mysql_store_result 结果集，析构时释放
class ResultSet
{
public:
    explicit ResultSet(MYSQL_RES *result) : result_(result) {}
    ~ResultSet();

    ResultSet(const ResultSet &) = delete;
    ResultSet &operator=(const ResultSet &) = delete;
    ResultSet(ResultSet &&other) noexcept;
    ResultSet &operator=(ResultSet &&other) noexcept;

    // 取下一行，没有更多行时返回 nullptr
    MYSQL_ROW next() { return result_ ? mysql_fetch_row(result_) : nullptr; }

private:
    MYSQL_RES *result_;
};

// 借出的连接，析构时自动归还连接池
class PooledConnection
{
public:
    PooledConnection(MYSQL *conn, DatabaseConnectionPool *pool);
    ~PooledConnection();

    PooledConnection(const PooledConnection &) = delete;
    PooledConnection &operator=(const PooledConnection &) = delete;
    PooledConnection(PooledConnection &&other) noexcept;
    PooledConnection &operator=(PooledConnection &&other) noexcept;

    MYSQL *get() const { return connection_; }

    // 执行不返回结果集的语句，返回受影响行数；失败抛出 StoreError
    unsigned long long execute(const std::string &sql);

    // 执行 SELECT；失败抛出 StoreError
    ResultSet query(const std::string &sql);

    // 转义并加上单引号
    std::string quote(const std::string &value);

    // 插入语句：唯一键冲突时返回 false，其他错误抛出 StoreError
    bool try_insert(const std::string &sql);

private:
    static constexpr unsigned int duplicate_key_errno = 1062;

    MYSQL *connection_;
    DatabaseConnectionPool *pool_;
    unsigned int last_errno_ = 0;
};

// 事务守卫：未 commit 的事务在析构时回滚
class Transaction
{
public:
    explicit Transaction(PooledConnection &conn);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    PooledConnection &conn_;
    bool finished_ = false;
};

// MySQL 连接池
class DatabaseConnectionPool
{
    friend class PooledConnection;

public:
    DatabaseConnectionPool(const DatabaseConfig &db_config, const PoolConfig &pool_config);
    ~DatabaseConnectionPool();

    bool initialize();

    // 借出连接；超时或连接池已关闭时抛出 StoreError
    PooledConnection acquire();

    void shutdown();

    std::string get_status() const;

    // 关闭闲置过久的多余连接，并补足最小连接数
    void cleanup_idle_connections();

    bool is_valid() const { return initialized_; }

private:
    void release(MYSQL *connection);
    // 以 CLIENT_FOUND_ROWS 连接，UPDATE 返回匹配行数而非变更行数
    MYSQL *create_connection();
    void destroy_connection(MYSQL *connection);
    static bool is_connection_valid(MYSQL *connection);
    void cleanup_worker();

    DatabaseConfig db_config_;
    PoolConfig pool_config_;

    struct ConnectionInfo
    {
        MYSQL *connection;
        std::chrono::steady_clock::time_point last_used;
    };

    std::queue<MYSQL *> available_connections_;
    std::vector<ConnectionInfo> connections_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable cleanup_condition_;
    std::atomic<bool> initialized_;
    std::atomic<bool> shutdown_requested_;
    std::atomic<size_t> active_connections_;
    std::thread cleanup_thread_;
};
