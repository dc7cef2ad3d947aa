#pragma once

/**
 * @file recording_query_executor.h
 * @brief IQueryExecutor that records every statement and replays scripted results
 *
 * Used by repository tests to check the SQL and parameters that reach
 * storage without a database. Unscripted queries return an empty array,
 * unscripted commands report one affected row.
 */

#include "i_query_executor.h"
#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_fakes {

struct RecordedCall {
    std::string kind;   // query, command, scalar, begin, commit, rollback
    std::string sql;
    std::vector<std::string> params;
};

struct ExecutorLog {
    std::vector<RecordedCall> calls;
    std::deque<Json::Value> queryResults;
    std::deque<int> commandResults;
    std::deque<Json::Value> scalarResults;

    /// Invoked before each statement; throw from it to simulate a storage error
    std::function<void(const RecordedCall&)> onStatement;

    size_t count(const std::string& kind) const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [&](const RecordedCall& c) { return c.kind == kind; }));
    }

    const RecordedCall& last(const std::string& kind) const {
        for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
            if (it->kind == kind) return *it;
        }
        throw std::logic_error("no recorded call of kind " + kind);
    }

    Json::Value runQuery(const std::string& sql, const std::vector<std::string>& params) {
        record("query", sql, params);
        if (queryResults.empty()) return Json::Value(Json::arrayValue);
        Json::Value result = queryResults.front();
        queryResults.pop_front();
        return result;
    }

    int runCommand(const std::string& sql, const std::vector<std::string>& params) {
        record("command", sql, params);
        if (commandResults.empty()) return 1;
        int result = commandResults.front();
        commandResults.pop_front();
        return result;
    }

    Json::Value runScalar(const std::string& sql, const std::vector<std::string>& params) {
        record("scalar", sql, params);
        if (scalarResults.empty()) return Json::Value(0);
        Json::Value result = scalarResults.front();
        scalarResults.pop_front();
        return result;
    }

    void record(const std::string& kind, const std::string& sql = "",
                const std::vector<std::string>& params = {}) {
        RecordedCall call{kind, sql, params};
        calls.push_back(call);
        if (onStatement) onStatement(call);
    }
};

class RecordingTransaction : public common::ITransaction {
public:
    explicit RecordingTransaction(std::shared_ptr<ExecutorLog> log) : log_(std::move(log)) {}

    ~RecordingTransaction() override {
        if (active_) rollback();
    }

    Json::Value executeQuery(const std::string& query,
                             const std::vector<std::string>& params = {}) override {
        return log_->runQuery(query, params);
    }

    int executeCommand(const std::string& query,
                       const std::vector<std::string>& params) override {
        return log_->runCommand(query, params);
    }

    Json::Value executeScalar(const std::string& query,
                              const std::vector<std::string>& params = {}) override {
        return log_->runScalar(query, params);
    }

    std::unique_ptr<common::ITransaction> beginTransaction() override {
        throw std::logic_error("nested transaction");
    }

    std::string getDatabaseType() const override { return "recording"; }

    void commit() override {
        active_ = false;
        log_->calls.push_back({"commit", "", {}});
    }

    void rollback() noexcept override {
        if (!active_) return;
        active_ = false;
        log_->calls.push_back({"rollback", "", {}});
    }

    bool isActive() const override { return active_; }

private:
    std::shared_ptr<ExecutorLog> log_;
    bool active_ = true;
};

class RecordingQueryExecutor : public common::IQueryExecutor {
public:
    RecordingQueryExecutor() : log_(std::make_shared<ExecutorLog>()) {}

    Json::Value executeQuery(const std::string& query,
                             const std::vector<std::string>& params = {}) override {
        return log_->runQuery(query, params);
    }

    int executeCommand(const std::string& query,
                       const std::vector<std::string>& params) override {
        return log_->runCommand(query, params);
    }

    Json::Value executeScalar(const std::string& query,
                              const std::vector<std::string>& params = {}) override {
        return log_->runScalar(query, params);
    }

    std::unique_ptr<common::ITransaction> beginTransaction() override {
        log_->record("begin");
        return std::make_unique<RecordingTransaction>(log_);
    }

    std::string getDatabaseType() const override { return "recording"; }

    ExecutorLog& log() { return *log_; }

private:
    std::shared_ptr<ExecutorLog> log_;
};

} // namespace test_fakes
