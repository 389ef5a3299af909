#include "cache/store_factory.hpp"
#include "cache/sqlite_memo_store.hpp"
#include <stdexcept>

namespace glyphnet {

std::unique_ptr<MemoStore> make_memo_store(const ConfigCache& cache) {
    if (cache.backend == "none") {
        return std::make_unique<NullMemoStore>();
    }

    MemoryMemoStore::Config memory;
    memory.max_entries = static_cast<size_t>(cache.max_entries);
    memory.precision = cache.precision;
    memory.cull_probability = cache.cull_probability;
    memory.seed = cache.seed;

    std::string error;
    if (cache.backend == "memory") {
        if (!memory.validate(error)) throw std::invalid_argument("cache: " + error);
        return std::make_unique<MemoryMemoStore>(memory);
    }
    if (cache.backend == "sqlite") {
        SqliteMemoStore::Config sqlite;
        sqlite.path = cache.db_path;
        sqlite.memory = memory;
        if (!sqlite.validate(error)) throw std::invalid_argument("cache: " + error);
        return std::make_unique<SqliteMemoStore>(sqlite);
    }
    throw std::invalid_argument("unknown cache backend '" + cache.backend + "'");
}

}
