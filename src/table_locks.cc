#include "rezzy/table_locks.h"

#include <algorithm>

#include "utl/get_or_create.h"

namespace rezzy {

std::mutex& table_locks::get(table_id_t const id) {
  auto const lock = std::lock_guard{mutex_};
  return *utl::get_or_create(table_mutexes_, id,
                             []() { return std::make_unique<std::mutex>(); });
}

table_locks::guard table_locks::lock(std::vector<table_id_t> tables) {
  std::sort(begin(tables), end(tables));
  tables.erase(std::unique(begin(tables), end(tables)), end(tables));

  auto g = guard{};
  g.locks_.reserve(tables.size());
  for (auto const id : tables) {
    g.locks_.emplace_back(get(id));
  }
  g.tables_ = std::move(tables);
  return g;
}

}  // namespace rezzy
