#ifndef TWALK_TRACEDB_H
#define TWALK_TRACEDB_H

#include <memory>
#include <string>
#include <vector>

#include <TWalk/TypeDefs.h>
#include <TWalk/Trace.h>
#include <TWalk/TWalk.h>

// forward declaring the sqlite3 handle
struct sqlite3;

// Storage of chain output in a sqlite database:
//  - `chain`: one row per chain (chain, seed)
//  - `trace`: one row per record (chain, iteration, energy, th0, th1, ...)
//  - `kernel_stats`: one row per chain and kernel
//
// Writing a chain that is already stored replaces it.
// Every sqlite error is raised as std::runtime_error.

namespace TW {

class TraceDB {

    public:
        // does not touch the file; it is created on first use
        TraceDB(const std::string & path);
        ~TraceDB();

        TraceDB(const TraceDB &) = delete;
        TraceDB & operator=(const TraceDB &) = delete;

        const std::string & path() const { return _path; }

        // @return true if the database file exists
        bool exists() const;

        // @return true if all tables are present
        bool is_setup();

        // @param dim: number of coordinates of each trace record
        // @return true only if this call created the tables; repeated
        //         invocations leave the database alone and return false
        // @throws std::invalid_argument if the database is set up for a different dimension
        bool setup(const size_t dim, const size_t verbose = 0);

        // number of coordinates per record, as set up
        size_t dim();

        void write_trace(const Trace & trace, const size_t chain, const unsigned long int seed);
        void write_kernel_stats(const KernelStatsArray & stats, const size_t chain);

        // @throws std::out_of_range if the chain is not stored
        Trace read_trace(const size_t chain);
        KernelStatsArray read_kernel_stats(const size_t chain);
        unsigned long int read_seed(const size_t chain);

        // stored chain indices, ascending
        std::vector<size_t> chains();

    private:
        const std::string _path;
        sqlite3 * _db;

        sqlite3 * _open();
        void _exec(const std::string & sql);
        bool _table_exists(const std::string & table_name);
};

}

#endif // TWALK_TRACEDB_H
