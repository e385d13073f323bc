#include <TWalk/TraceDB.h>

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include <TWalk/TWalkUtil.h>

using std::endl;
using std::string;
using std::stringstream;
using std::vector;

const string CHAIN_TABLE = "chain";
const string TRACE_TABLE = "trace";
const string KERNEL_TABLE = "kernel_stats";

namespace TW {

// non-exported: raise sqlite failures
void _db_check(sqlite3 * db, const int rc, const string & what) {
    if ((rc != SQLITE_OK) and (rc != SQLITE_ROW) and (rc != SQLITE_DONE)) {
        throw std::runtime_error("sqlite error during " + what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
    }
}

struct StmtFinalize {
    void operator()(sqlite3_stmt * s) const { sqlite3_finalize(s); }
};

typedef std::unique_ptr<sqlite3_stmt, StmtFinalize> Statement;

Statement _prepare(sqlite3 * db, const string & sql) {
    sqlite3_stmt * stmt = nullptr;
    _db_check(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr), "prepare of: " + sql);
    return Statement(stmt);
}

// column name of coordinate c
string _theta_col(const size_t c) { return "th" + std::to_string(c); }

TraceDB::TraceDB(const string & path) : _path(path), _db(nullptr) {}

TraceDB::~TraceDB() {
    if (_db) { sqlite3_close(_db); }
}

bool TraceDB::exists() const { return file_exists(_path); }

sqlite3 * TraceDB::_open() {
    if (not _db) {
        const int rc = sqlite3_open_v2(_path.c_str(), &_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            const string msg = _db ? sqlite3_errmsg(_db) : sqlite3_errstr(rc);
            if (_db) { sqlite3_close(_db); _db = nullptr; }
            throw std::runtime_error("could not open database " + _path + ": " + msg);
        }
    }
    return _db;
}

void TraceDB::_exec(const string & sql) {
    char * err = nullptr;
    const int rc = sqlite3_exec(_open(), sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw std::runtime_error("Failed query:\n" + sql + "\n" + msg);
    }
}

bool TraceDB::_table_exists(const string & table_name) {
    Statement s = _prepare(_open(), "SELECT COUNT(*) FROM sqlite_master WHERE type == 'table' AND name = ?;");
    _db_check(_db, sqlite3_bind_text(s.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT), "bind");
    _db_check(_db, sqlite3_step(s.get()), "table check");
    return sqlite3_column_int(s.get(), 0) > 0;
}

bool TraceDB::is_setup() {
    if (not exists()) { return false; }
    return _table_exists(CHAIN_TABLE) and _table_exists(TRACE_TABLE) and _table_exists(KERNEL_TABLE);
}

size_t TraceDB::dim() {
    if (not is_setup()) { throw std::logic_error("database " + _path + " is not set up"); }
    Statement s = _prepare(_open(), "SELECT * FROM " + TRACE_TABLE + " LIMIT 0;");
    // chain, iteration, energy, then the coordinates
    return sqlite3_column_count(s.get()) - 3;
}

bool TraceDB::setup(const size_t dim, const size_t verbose) {
    if (dim == 0) { throw std::invalid_argument("trace dimension must be positive"); }
    if (is_setup()) {
        if (this->dim() != dim) {
            throw std::invalid_argument(
                "database " + _path + " holds " + std::to_string(this->dim()) + "-dimensional traces, not " + std::to_string(dim)
            );
        }
        if (verbose > 0) { std::cerr << "Database " << _path << " already set up; leaving it alone." << endl; }
        return false;
    }

    stringstream ss;
    ss << "BEGIN TRANSACTION;";
    ss << "CREATE TABLE " << CHAIN_TABLE << " (chain INTEGER PRIMARY KEY, seed INTEGER);";
    ss << "CREATE TABLE " << TRACE_TABLE << " (chain INTEGER, iteration INTEGER, energy REAL";
    for (size_t c = 0; c < dim; ++c) { ss << ", " << _theta_col(c) << " REAL"; }
    ss << ", PRIMARY KEY (chain, iteration));";
    ss << "CREATE TABLE " << KERNEL_TABLE
       << " (chain INTEGER, kernel INTEGER, name TEXT, proposed INTEGER, accepted INTEGER,"
       << " out_of_support INTEGER, degenerate INTEGER, model_failures INTEGER, PRIMARY KEY (chain, kernel));";
    ss << "COMMIT;";
    _exec(ss.str());

    if (verbose > 0) { std::cerr << "Set up database " << _path << " for " << dim << "-dimensional traces." << endl; }
    return true;
}

void TraceDB::write_trace(const Trace & trace, const size_t chain, const unsigned long int seed) {
    if (not is_setup()) { throw std::logic_error("database " + _path + " is not set up"); }
    const size_t d = dim();
    if (trace.dim() != d) {
        throw std::invalid_argument("trace dimension " + std::to_string(trace.dim()) + " does not match database dimension " + std::to_string(d));
    }

    _exec("BEGIN TRANSACTION;");
    try {
        {
            Statement del = _prepare(_db, "DELETE FROM " + TRACE_TABLE + " WHERE chain = ?;");
            _db_check(_db, sqlite3_bind_int64(del.get(), 1, chain), "bind");
            _db_check(_db, sqlite3_step(del.get()), "delete of chain " + std::to_string(chain));
        }
        {
            Statement ins = _prepare(_db, "INSERT OR REPLACE INTO " + CHAIN_TABLE + " (chain, seed) VALUES (?, ?);");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 1, chain), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 2, static_cast<sqlite3_int64>(seed)), "bind");
            _db_check(_db, sqlite3_step(ins.get()), "insert of chain " + std::to_string(chain));
        }

        stringstream ss;
        ss << "INSERT INTO " << TRACE_TABLE << " (chain, iteration, energy";
        for (size_t c = 0; c < d; ++c) { ss << ", " << _theta_col(c); }
        ss << ") VALUES (?, ?, ?";
        for (size_t c = 0; c < d; ++c) { ss << ", ?"; }
        ss << ");";
        Statement ins = _prepare(_db, ss.str());

        for (size_t i = 0; i < trace.size(); ++i) {
            const TraceRecord rec = trace.at(i);
            _db_check(_db, sqlite3_bind_int64(ins.get(), 1, chain), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 2, i), "bind");
            _db_check(_db, sqlite3_bind_double(ins.get(), 3, rec.energy), "bind");
            for (size_t c = 0; c < d; ++c) {
                _db_check(_db, sqlite3_bind_double(ins.get(), 4 + c, rec.theta[c]), "bind");
            }
            _db_check(_db, sqlite3_step(ins.get()), "insert of trace record " + std::to_string(i));
            sqlite3_reset(ins.get());
        }
    } catch (...) {
        sqlite3_exec(_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    _exec("COMMIT;");
}

void TraceDB::write_kernel_stats(const KernelStatsArray & stats, const size_t chain) {
    if (not is_setup()) { throw std::logic_error("database " + _path + " is not set up"); }

    _exec("BEGIN TRANSACTION;");
    try {
        Statement ins = _prepare(_db,
            "INSERT OR REPLACE INTO " + KERNEL_TABLE +
            " (chain, kernel, name, proposed, accepted, out_of_support, degenerate, model_failures)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?);"
        );
        for (size_t k = 0; k < NUM_KERNELS; ++k) {
            const KernelStats & ks = stats[k];
            std::ostringstream name;
            name << static_cast<KERNEL>(k);
            _db_check(_db, sqlite3_bind_int64(ins.get(), 1, chain), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 2, k), "bind");
            _db_check(_db, sqlite3_bind_text(ins.get(), 3, name.str().c_str(), -1, SQLITE_TRANSIENT), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 4, ks.proposed), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 5, ks.accepted), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 6, ks.out_of_support), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 7, ks.degenerate), "bind");
            _db_check(_db, sqlite3_bind_int64(ins.get(), 8, ks.model_failures), "bind");
            _db_check(_db, sqlite3_step(ins.get()), "insert of kernel statistics");
            sqlite3_reset(ins.get());
        }
    } catch (...) {
        sqlite3_exec(_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    _exec("COMMIT;");
}

Trace TraceDB::read_trace(const size_t chain) {
    const size_t d = dim();
    stringstream ss;
    ss << "SELECT energy";
    for (size_t c = 0; c < d; ++c) { ss << ", " << _theta_col(c); }
    ss << " FROM " << TRACE_TABLE << " WHERE chain = ? ORDER BY iteration;";
    Statement s = _prepare(_db, ss.str());
    _db_check(_db, sqlite3_bind_int64(s.get(), 1, chain), "bind");

    Trace trace(d);
    Row theta(d);
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        for (size_t c = 0; c < d; ++c) { theta[c] = sqlite3_column_double(s.get(), 1 + c); }
        trace.append(theta, sqlite3_column_double(s.get(), 0));
    }
    _db_check(_db, rc, "read of chain " + std::to_string(chain));
    if (trace.empty()) { throw std::out_of_range("no trace stored for chain " + std::to_string(chain)); }
    return trace;
}

KernelStatsArray TraceDB::read_kernel_stats(const size_t chain) {
    if (not is_setup()) { throw std::logic_error("database " + _path + " is not set up"); }
    Statement s = _prepare(_db,
        "SELECT kernel, proposed, accepted, out_of_support, degenerate, model_failures FROM "
        + KERNEL_TABLE + " WHERE chain = ?;"
    );
    _db_check(_db, sqlite3_bind_int64(s.get(), 1, chain), "bind");

    KernelStatsArray stats;
    size_t found = 0;
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        const sqlite3_int64 k = sqlite3_column_int64(s.get(), 0);
        if ((k < 0) or (k >= NUM_KERNELS)) { throw std::runtime_error("corrupt kernel index in " + _path); }
        KernelStats & ks = stats[k];
        ks.proposed = sqlite3_column_int64(s.get(), 1);
        ks.accepted = sqlite3_column_int64(s.get(), 2);
        ks.out_of_support = sqlite3_column_int64(s.get(), 3);
        ks.degenerate = sqlite3_column_int64(s.get(), 4);
        ks.model_failures = sqlite3_column_int64(s.get(), 5);
        ++found;
    }
    _db_check(_db, rc, "read of kernel statistics");
    if (found == 0) { throw std::out_of_range("no kernel statistics stored for chain " + std::to_string(chain)); }
    return stats;
}

unsigned long int TraceDB::read_seed(const size_t chain) {
    if (not is_setup()) { throw std::logic_error("database " + _path + " is not set up"); }
    Statement s = _prepare(_db, "SELECT seed FROM " + CHAIN_TABLE + " WHERE chain = ?;");
    _db_check(_db, sqlite3_bind_int64(s.get(), 1, chain), "bind");
    const int rc = sqlite3_step(s.get());
    _db_check(_db, rc, "read of chain seed");
    if (rc != SQLITE_ROW) { throw std::out_of_range("no chain " + std::to_string(chain) + " in " + _path); }
    return static_cast<unsigned long int>(sqlite3_column_int64(s.get(), 0));
}

vector<size_t> TraceDB::chains() {
    vector<size_t> out;
    if (not is_setup()) { return out; }
    Statement s = _prepare(_db, "SELECT chain FROM " + CHAIN_TABLE + " ORDER BY chain;");
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) { out.push_back(sqlite3_column_int64(s.get(), 0)); }
    _db_check(_db, rc, "read of chains");
    return out;
}

}
