#include "cstfs/diff.hpp"

#include <iostream>
#include <string>
#include <vector>

using cstfs::DiffKind;
using cstfs::DiffRecord;

static std::size_t count_kind(const std::vector<DiffRecord> &xs, DiffKind k) {
  std::size_t n = 0;
  for (const auto &r : xs)
    n += r.kind == k ? 1 : 0;
  return n;
}

static DiffRecord make(std::string path, std::string hash, DiffKind kind) {
  return DiffRecord{.path = std::move(path), .hash = std::move(hash), .kind = kind};
}

int main() {
  const std::string h1 = "1111111111111111";
  const std::string h2 = "2222222222222222";
  const std::string h3 = "3333333333333333";

  // 1) New + Removed with the same digest => one Moved
  {
    const cstfs::IndexSnapshot persisted = {{.path = "a.jpg", .hash = h1},
                                            {.path = "b.jpg", .hash = h2}};
    std::vector<DiffRecord> xs = {make("c.jpg", h1, DiffKind::New),
                                  make("a.jpg", h1, DiffKind::Removed)};
    const auto merges = cstfs::diff::coalesce(xs, persisted);
    if (merges != 1 || xs.size() != 1 || xs[0].kind != DiffKind::Moved || xs[0].path != "c.jpg" ||
        xs[0].original_path != "a.jpg" || xs[0].hash != h1) {
      std::cerr << "expected single Moved{c.jpg <- a.jpg}\n";
      return 1;
    }
  }

  // 2) New whose digest is indexed under a live path => Duplicate
  {
    const cstfs::IndexSnapshot persisted = {{.path = "a.jpg", .hash = h1}};
    std::vector<DiffRecord> xs = {make("d.jpg", h1, DiffKind::New)};
    cstfs::diff::coalesce(xs, persisted);
    if (xs.size() != 1 || xs[0].kind != DiffKind::Duplicate || xs[0].original_path != "a.jpg") {
      std::cerr << "expected Duplicate{d.jpg of a.jpg}\n";
      return 1;
    }
  }

  // 3) Mixed set: unknown New stays, Changed and unmatched Removed untouched
  std::vector<DiffRecord> mixed;
  const cstfs::IndexSnapshot persisted = {{.path = "a.jpg", .hash = h1},
                                          {.path = "b.jpg", .hash = h2},
                                          {.path = "e.jpg", .hash = "eeeeeeeeeeeeeeee"}};
  {
    mixed = {make("x.jpg", h3, DiffKind::New),
             make("b.jpg", "9999999999999999", DiffKind::Changed),
             make("c.jpg", h1, DiffKind::New),
             make("f.jpg", h2, DiffKind::New),
             make("a.jpg", h1, DiffKind::Removed),
             make("e.jpg", "eeeeeeeeeeeeeeee", DiffKind::Removed)};
    mixed[1].previous_hash = h2;
    const auto before = mixed.size();
    const auto merges = cstfs::diff::coalesce(mixed, persisted);

    if (merges != 2 || mixed.size() != before - 1) {
      std::cerr << "expected 2 merges and one record fewer, got " << merges << "/" << mixed.size()
                << "\n";
      return 1;
    }
    const auto s = cstfs::diff::summarize(mixed);
    if (s.added != 1 || s.changed != 1 || s.removed != 1 || s.moved != 1 || s.duplicates != 1 ||
        s.total() != mixed.size()) {
      std::cerr << "unexpected summary\n";
      return 1;
    }
    for (const auto &r : mixed) {
      if (r.kind == DiffKind::Duplicate && (r.path != "f.jpg" || r.original_path != "b.jpg")) {
        std::cerr << "wrong duplicate record\n";
        return 1;
      }
      if (r.kind == DiffKind::Removed && r.path != "e.jpg") {
        std::cerr << "matched Removed survived\n";
        return 1;
      }
      if (r.kind == DiffKind::New && r.path != "x.jpg") {
        std::cerr << "wrong New survived\n";
        return 1;
      }
    }
  }

  // 4) Fixed point: a second run merges nothing and changes nothing
  {
    auto again = mixed;
    if (cstfs::diff::coalesce(again, persisted) != 0 || again.size() != mixed.size()) {
      std::cerr << "coalescing its own output merged again\n";
      return 1;
    }
    for (std::size_t i = 0; i < again.size(); ++i) {
      if (again[i].kind != mixed[i].kind || again[i].path != mixed[i].path) {
        std::cerr << "second run reordered or rewrote records\n";
        return 1;
      }
    }
  }

  // 5) Two copies of a moved file: one Moved, the other a Duplicate; count never grows
  {
    const cstfs::IndexSnapshot snap = {{.path = "a.jpg", .hash = h1}};
    std::vector<DiffRecord> xs = {make("p.jpg", h1, DiffKind::New),
                                  make("q.jpg", h1, DiffKind::New),
                                  make("a.jpg", h1, DiffKind::Removed)};
    cstfs::diff::coalesce(xs, snap);
    if (xs.size() != 2 || count_kind(xs, DiffKind::Moved) != 1 ||
        count_kind(xs, DiffKind::Duplicate) != 1 || count_kind(xs, DiffKind::Removed) != 0) {
      std::cerr << "expected one Moved and one Duplicate\n";
      return 1;
    }
    if (xs[0].kind != DiffKind::Moved || xs[0].path != "p.jpg") {
      std::cerr << "first New should take the move\n";
      return 1;
    }
  }

  // 6) Nothing indexed => nothing merges
  {
    std::vector<DiffRecord> xs = {make("n.jpg", h1, DiffKind::New),
                                  make("r.jpg", h1, DiffKind::Removed)};
    if (cstfs::diff::coalesce(xs, {}) != 0 || xs.size() != 2) {
      std::cerr << "merged without an indexed digest\n";
      return 1;
    }
  }

  if (cstfs::diff::describe(make("c.jpg", h1, DiffKind::New)) != "new: c.jpg") {
    std::cerr << "describe mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
