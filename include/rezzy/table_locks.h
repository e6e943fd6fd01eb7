#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "rezzy/types.h"

namespace rezzy {

// Registry of exclusive per-table locks. A check-then-write on a set of
// tables holds the locks of all of them, always acquired in ascending
// table id order.
struct table_locks {
  struct guard {
    std::vector<table_id_t> tables_;
    std::vector<std::unique_lock<std::mutex>> locks_;
  };

  [[nodiscard]] guard lock(std::vector<table_id_t> tables);

private:
  std::mutex& get(table_id_t);

  std::mutex mutex_;
  std::map<table_id_t, std::unique_ptr<std::mutex>> table_mutexes_;
};

}  // namespace rezzy
