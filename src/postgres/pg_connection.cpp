// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <pgbind/core/result_helpers.h>
#include <pgbind/postgres/pg_connection.h>

namespace pgbind::postgres {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kDrainTimeout = std::chrono::seconds(5);
constexpr std::string_view kQueryCanceled = "57014";

Error cancelled() {
    return Error{ErrorCode::OperationCancelled, "statement cancelled"};
}

std::string chomp(const char* message) {
    std::string out = message ? message : "";
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

void noticeReceiver(void*, const PGresult* result) {
    spdlog::debug("pgbind: server notice: {}", chomp(PQresultErrorMessage(result)));
}

void materialize(const PGresult* result, Row::Columns& columns, std::vector<Row>& rows) {
    int fields = PQnfields(result);
    int tuples = PQntuples(result);

    auto names = std::make_shared<std::vector<std::string>>();
    names->reserve(static_cast<std::size_t>(fields));
    for (int field = 0; field < fields; ++field) {
        names->emplace_back(PQfname(result, field));
    }
    columns = std::move(names);

    rows.clear();
    rows.reserve(static_cast<std::size_t>(tuples));
    for (int tuple = 0; tuple < tuples; ++tuple) {
        std::vector<Row::Cell> cells;
        cells.reserve(static_cast<std::size_t>(fields));
        for (int field = 0; field < fields; ++field) {
            if (PQgetisnull(result, tuple, field)) {
                cells.emplace_back(std::nullopt);
            } else {
                cells.emplace_back(std::string(PQgetvalue(result, tuple, field),
                                               static_cast<std::size_t>(
                                                   PQgetlength(result, tuple, field))));
            }
        }
        rows.emplace_back(columns, std::move(cells));
    }
}

} // namespace

Error resultError(const PGresult* result) {
    const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    const char* primary = PQresultErrorField(result, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = primary ? primary : chomp(PQresultErrorMessage(result));
    if (message.empty()) {
        message = PQresStatus(PQresultStatus(result));
    }

    ErrorCode code = ErrorCode::DatabaseError;
    std::string_view sqlstate = state ? state : "";
    if (sqlstate == kQueryCanceled) {
        code = ErrorCode::OperationCancelled;
    } else if (sqlstate.starts_with("08")) {
        code = ErrorCode::ConnectionFailed;
    }
    if (sqlstate.empty()) {
        return Error{code, message};
    }
    return Error{code, fmt::format("{} (SQLSTATE {})", message, sqlstate)};
}

PgConnection::~PgConnection() {
    close();
}

Result<std::unique_ptr<PgConnection>> PgConnection::connect(const std::string& conninfo,
                                                            std::chrono::milliseconds timeout,
                                                            std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelled();
    }

    std::unique_ptr<PgConnection> conn(new PgConnection());
    conn->conn_ = PQconnectStart(conninfo.c_str());
    if (!conn->conn_) {
        return Error{ErrorCode::ConnectionFailed, "PQconnectStart() failed: out of memory"};
    }
    if (PQstatus(conn->conn_) == CONNECTION_BAD) {
        return conn->connectionError(ErrorCode::ConnectionFailed, "PQconnectStart() failed");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    PostgresPollingStatusType status = PGRES_POLLING_WRITING;
    while (status != PGRES_POLLING_OK) {
        if (status == PGRES_POLLING_FAILED) {
            return conn->connectionError(ErrorCode::ConnectionFailed, "connection failed");
        }
        PGBIND_TRY_UNWRAP(ready,
                          conn->waitSocket(status == PGRES_POLLING_WRITING, stop, deadline));
        if (!ready) {
            return cancelled();
        }
        status = PQconnectPoll(conn->conn_);
    }

    if (PQsetnonblocking(conn->conn_, 1) != 0) {
        return conn->connectionError(ErrorCode::ConnectionFailed, "PQsetnonblocking() failed");
    }
    PQsetNoticeReceiver(conn->conn_, noticeReceiver, nullptr);

    spdlog::debug("pgbind: connected to {}:{} (server {})", PQhost(conn->conn_),
                  PQport(conn->conn_), conn->serverVersion());
    return conn;
}

Result<RowSet> PgConnection::execute(const Query& query, std::stop_token stop) {
    return send(toPositional(query), stop);
}

Result<RowSet> PgConnection::execute(std::string_view sql, std::stop_token stop) {
    return send(PositionalQuery{std::string(sql), {}, {}}, stop);
}

Result<RowSet> PgConnection::send(const PositionalQuery& query, std::stop_token stop) {
    if (!conn_) {
        return Error{ErrorCode::InvalidState, "connection is closed"};
    }
    if (stop.stop_requested()) {
        return cancelled();
    }

    int sent = 0;
    if (query.params.empty()) {
        sent = PQsendQuery(conn_, query.sql.c_str());
    } else {
        std::vector<const char*> values;
        values.reserve(query.params.size());
        for (const auto& param : query.params) {
            values.push_back(param ? param->c_str() : nullptr);
        }
        sent = PQsendQueryParams(conn_, query.sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    }
    if (!sent) {
        return connectionError(ErrorCode::DatabaseError, "PQsendQuery() failed");
    }

    auto flushed = flush(stop);
    if (!flushed) {
        if (flushed.error().code == ErrorCode::OperationCancelled) {
            cancel();
            drain();
        }
        return flushed.error();
    }
    return collect(stop);
}

Result<void> PgConnection::flush(std::stop_token stop) {
    while (true) {
        int rc = PQflush(conn_);
        if (rc == 0) {
            return {};
        }
        if (rc < 0) {
            return connectionError(ErrorCode::ConnectionFailed, "PQflush() failed");
        }
        PGBIND_TRY_UNWRAP(ready, waitSocket(true, stop));
        if (!ready) {
            return cancelled();
        }
    }
}

Result<RowSet> PgConnection::collect(std::stop_token stop) {
    std::vector<Row> rows;
    Row::Columns columns;
    Error failure;

    while (true) {
        while (PQisBusy(conn_)) {
            auto ready = waitSocket(false, stop);
            if (!ready) {
                broken_ = true;
                return ready.error();
            }
            if (!ready.value()) {
                cancel();
                drain();
                return cancelled();
            }
            if (!PQconsumeInput(conn_)) {
                return connectionError(ErrorCode::ConnectionFailed, "PQconsumeInput() failed");
            }
        }

        PGresult* result = PQgetResult(conn_);
        if (!result) {
            break;
        }
        std::unique_ptr<PGresult, decltype(&PQclear)> guard(result, &PQclear);

        switch (PQresultStatus(result)) {
            case PGRES_COMMAND_OK:
            case PGRES_EMPTY_QUERY:
                break;
            case PGRES_TUPLES_OK:
                materialize(result, columns, rows);
                break;
            case PGRES_COPY_IN:
            case PGRES_COPY_OUT:
            case PGRES_COPY_BOTH:
                // The connection is left in COPY state
                broken_ = true;
                if (failure.ok()) {
                    failure = Error{ErrorCode::NotImplemented, "COPY is not supported"};
                }
                break;
            default:
                if (failure.ok()) {
                    failure = resultError(result);
                }
                break;
        }
        if (broken_) {
            break;
        }
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        broken_ = true;
    }
    if (!failure.ok()) {
        return failure;
    }
    return RowSet(std::move(rows));
}

Result<Notification> PgConnection::waitForNotification(std::stop_token stop) {
    if (!conn_) {
        return Error{ErrorCode::InvalidState, "connection is closed"};
    }

    while (true) {
        if (!PQconsumeInput(conn_)) {
            return connectionError(ErrorCode::ConnectionFailed, "PQconsumeInput() failed");
        }
        if (PGnotify* notify = PQnotifies(conn_)) {
            Notification out;
            out.channel = notify->relname ? notify->relname : "";
            std::string_view payload = notify->extra ? notify->extra : "";
            out.payload.resize(payload.size());
            std::memcpy(out.payload.data(), payload.data(), payload.size());
            PQfreemem(notify);
            return out;
        }

        auto ready = waitSocket(false, stop);
        if (!ready) {
            broken_ = true;
            return ready.error();
        }
        if (!ready.value()) {
            return cancelled();
        }
    }
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PgConnection::isReusable() const {
    return conn_ && !broken_ && PQstatus(conn_) == CONNECTION_OK &&
           PQtransactionStatus(conn_) == PQTRANS_IDLE;
}

int PgConnection::serverVersion() const {
    return conn_ ? PQserverVersion(conn_) : 0;
}

Result<bool> PgConnection::waitSocket(
    bool forWrite, std::stop_token stop,
    std::optional<std::chrono::steady_clock::time_point> deadline) {
    int fd = PQsocket(conn_);
    if (fd < 0) {
        return connectionError(ErrorCode::ConnectionFailed, "connection has no socket");
    }

    while (true) {
        if (stop.stop_requested()) {
            return false;
        }
        auto wait = kPollSlice;
        if (deadline) {
            auto now = std::chrono::steady_clock::now();
            if (now >= *deadline) {
                return Error{ErrorCode::Timeout, "timed out waiting for the server"};
            }
            wait = std::max(std::chrono::milliseconds(1),
                            std::min(kPollSlice, std::chrono::duration_cast<std::chrono::milliseconds>(
                                                     *deadline - now)));
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = forWrite ? POLLOUT : POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if (rc > 0) {
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            return Error{ErrorCode::ConnectionFailed,
                         fmt::format("poll() failed: {}", std::strerror(errno))};
        }
    }
}

void PgConnection::cancel() {
    PGcancel* handle = PQgetCancel(conn_);
    if (!handle) {
        broken_ = true;
        return;
    }
    char errbuf[256] = {};
    if (!PQcancel(handle, errbuf, sizeof(errbuf))) {
        spdlog::warn("pgbind: PQcancel() failed: {}", errbuf);
        broken_ = true;
    }
    PQfreeCancel(handle);
}

void PgConnection::drain() {
    auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
    while (true) {
        while (PQisBusy(conn_)) {
            auto ready = waitSocket(false, {}, deadline);
            if (!ready || !ready.value() || !PQconsumeInput(conn_)) {
                broken_ = true;
                return;
            }
        }
        PGresult* result = PQgetResult(conn_);
        if (!result) {
            return;
        }
        PQclear(result);
    }
}

Error PgConnection::connectionError(ErrorCode code, std::string_view what) {
    if (!conn_ || PQstatus(conn_) == CONNECTION_BAD) {
        broken_ = true;
    }
    std::string detail = conn_ ? chomp(PQerrorMessage(conn_)) : std::string{};
    if (detail.empty()) {
        return Error{code, std::string(what)};
    }
    return Error{code, fmt::format("{}: {}", what, detail)};
}

} // namespace pgbind::postgres
