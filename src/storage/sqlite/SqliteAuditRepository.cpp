#include "lockbox/storage/sqlite/SqliteAuditRepositoryFactory.hpp"

#include "lockbox/storage/IAuditRepository.hpp"
#include "lockbox/storage/StorageErrors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace lockbox::storage::sqlite
{
namespace
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (rc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "PRAGMA journal_mode=WAL;");
    exec(db, "PRAGMA synchronous=FULL;");
    exec(db, "CREATE TABLE IF NOT EXISTS audit_log ("
             " seq INTEGER PRIMARY KEY,"
             " ts INTEGER NOT NULL,"
             " kind INTEGER NOT NULL,"
             " subject TEXT NOT NULL,"
             " prior_hash BLOB NOT NULL,"
             " entry_hash BLOB NOT NULL"
             ");");
}

void bindDigest(sqlite3* db, sqlite3_stmt* stmt, int index, const lockbox::crypto::Digest& digest)
{
    if (sqlite3_bind_blob(stmt, index, digest.data(), static_cast<int>(digest.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind digest failed"));
    }
}

void readDigest(sqlite3_stmt* stmt, int column, lockbox::crypto::Digest& out)
{
    const void* ptr = sqlite3_column_blob(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    if (ptr == nullptr || bytes < 0 || static_cast<std::size_t>(bytes) != out.size())
    {
        throw std::runtime_error("storage: invalid audit digest column");
    }
    const std::span<const std::uint8_t> src{ static_cast<const std::uint8_t*>(ptr), out.size() };
    std::copy(src.begin(), src.end(), out.begin());
}

[[nodiscard]] lockbox::storage::AuditRecord readRow(sqlite3_stmt* stmt)
{
    lockbox::storage::AuditRecord rec{};
    const sqlite3_int64 seq = sqlite3_column_int64(stmt, 0);
    const sqlite3_int64 kind = sqlite3_column_int64(stmt, 2);
    if (seq <= 0 || kind < 0 || kind > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::runtime_error("storage: invalid audit row");
    }
    rec.sequence = static_cast<std::uint64_t>(seq);
    rec.timestamp = sqlite3_column_int64(stmt, 1);
    rec.kind = static_cast<std::uint32_t>(kind);

    const unsigned char* subject = sqlite3_column_text(stmt, 3);
    const int subjectBytes = sqlite3_column_bytes(stmt, 3);
    if (subject != nullptr && subjectBytes > 0)
    {
        rec.subject.assign(reinterpret_cast<const char*>(subject), static_cast<std::size_t>(subjectBytes));
    }
    readDigest(stmt, 4, rec.priorHash);
    readDigest(stmt, 5, rec.entryHash);
    return rec;
}

[[nodiscard]] std::vector<lockbox::storage::AuditRecord> collectRows(sqlite3* db, sqlite3_stmt* stmt)
{
    std::vector<lockbox::storage::AuditRecord> out;
    for (;;)
    {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            out.push_back(readRow(stmt));
            continue;
        }
        if (rc == SQLITE_DONE)
        {
            return out;
        }
        throw std::runtime_error(sqliteErr(db, "storage: select audit rows failed"));
    }
}

// Rolls back unless commit() was reached.
class ImmediateTransaction final
{
public:
    explicit ImmediateTransaction(sqlite3* db) : m_db{ db }
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }
    ImmediateTransaction(const ImmediateTransaction&) = delete;
    ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;
    ImmediateTransaction(ImmediateTransaction&&) = delete;
    ImmediateTransaction& operator=(ImmediateTransaction&&) = delete;
    ~ImmediateTransaction()
    {
        if (!m_done)
        {
            (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        exec(m_db, "COMMIT;");
        m_done = true;
    }

private:
    sqlite3* m_db{ nullptr };
    bool m_done{ false };
};

constexpr const char* g_selectColumns{ "SELECT seq, ts, kind, subject, prior_hash, entry_hash FROM audit_log" };

class SqliteAuditRepository final : public lockbox::storage::IAuditRepository
{
public:
    explicit SqliteAuditRepository(const std::filesystem::path& dbPath) : m_db{ openDb(dbPath) }
    {
        ensureSchema(m_db.get());
    }

    [[nodiscard]] std::optional<lockbox::storage::AuditRecord> last() const override
    {
        const std::scoped_lock lock{ m_mutex };
        const std::string sql = std::string{ g_selectColumns } + " ORDER BY seq DESC LIMIT 1;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        auto rows = collectRows(m_db.get(), stmt.get());
        if (rows.empty())
        {
            return std::nullopt;
        }
        return rows.front();
    }

    void append(const lockbox::storage::AuditRecord& record) override
    {
        if (record.sequence == 0U || record.sequence > static_cast<std::uint64_t>(
                                                           std::numeric_limits<sqlite3_int64>::max()))
        {
            throw std::invalid_argument("storage: invalid audit sequence");
        }

        const std::scoped_lock lock{ m_mutex };
        ImmediateTransaction tx{ m_db.get() };

        auto head = prepare(m_db.get(), "SELECT COALESCE(MAX(seq), 0) FROM audit_log;");
        if (sqlite3_step(head.get()) != SQLITE_ROW)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "storage: select audit head failed"));
        }
        const auto current = static_cast<std::uint64_t>(sqlite3_column_int64(head.get(), 0));
        if (record.sequence != current + 1U)
        {
            throw lockbox::storage::AuditSequenceConflict("storage: audit append does not extend the chain head");
        }

        auto insert = prepare(m_db.get(), "INSERT INTO audit_log(seq, ts, kind, subject, prior_hash, entry_hash)"
                                          " VALUES (?, ?, ?, ?, ?, ?);");
        if (sqlite3_bind_int64(insert.get(), 1, static_cast<sqlite3_int64>(record.sequence)) != SQLITE_OK ||
            sqlite3_bind_int64(insert.get(), 2, record.timestamp) != SQLITE_OK ||
            sqlite3_bind_int64(insert.get(), 3, record.kind) != SQLITE_OK ||
            sqlite3_bind_text(insert.get(), 4, record.subject.data(), static_cast<int>(record.subject.size()),
                              SQLITE_STATIC) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "storage: bind audit row failed"));
        }
        bindDigest(m_db.get(), insert.get(), 5, record.priorHash);
        bindDigest(m_db.get(), insert.get(), 6, record.entryHash);

        if (sqlite3_step(insert.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "storage: insert audit row failed"));
        }
        tx.commit();
    }

    [[nodiscard]] std::vector<lockbox::storage::AuditRecord> readAll() const override
    {
        const std::scoped_lock lock{ m_mutex };
        const std::string sql = std::string{ g_selectColumns } + " ORDER BY seq ASC;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        return collectRows(m_db.get(), stmt.get());
    }

    [[nodiscard]] std::vector<lockbox::storage::AuditRecord> readLatest(std::size_t limit) const override
    {
        const std::scoped_lock lock{ m_mutex };
        const std::string sql = std::string{ g_selectColumns } + " ORDER BY seq DESC LIMIT ?;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        const auto capped = static_cast<sqlite3_int64>(
            std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<sqlite3_int64>::max())));
        if (sqlite3_bind_int64(stmt.get(), 1, capped) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "storage: bind limit failed"));
        }
        auto rows = collectRows(m_db.get(), stmt.get());
        std::reverse(rows.begin(), rows.end());
        return rows;
    }

private:
    mutable std::mutex m_mutex;
    SqliteDbPtr m_db;
};

} // namespace

std::unique_ptr<lockbox::storage::IAuditRepository> makeSqliteAuditRepository(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteAuditRepository>(dbPath);
}

} // namespace lockbox::storage::sqlite
