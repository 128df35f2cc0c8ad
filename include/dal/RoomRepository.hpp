#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roommates::dal {

class ConnectionFactory;

/// Row type for the Room table.
/// Class abbreviation: rr
struct RoomRow {
  int64_t iId = 0;  // assigned by the database; 0 before insert
  std::string sName;
  int iMaxOccupancy = 0;

  bool operator==(const RoomRow&) const = default;
};

/// CRUD over the Room table. Every call opens its own connection and
/// transaction, runs a single statement and releases both before returning.
/// Driver exceptions propagate unchanged.
/// Class abbreviation: rrp
class RoomRepository {
 public:
  explicit RoomRepository(ConnectionFactory& cfFactory);
  ~RoomRepository();

  /// Insert a room and set room.iId to the generated id. The incoming iId
  /// is ignored.
  void insert(RoomRow& room);

  /// Find a room by ID. Returns nullopt if not found.
  /// The returned iId is the argument, not a value read back from the row.
  std::optional<RoomRow> findById(int64_t iId);

  /// All rooms, in whatever order the database returns them.
  std::vector<RoomRow> listAll();

  /// Overwrite Name and MaxOccupancy of the row with room.iId.
  /// Returns rows affected; 0 if no such row (not an error).
  int update(const RoomRow& room);

  /// Delete the row with the given ID. Returns rows affected; 0 if no such
  /// row. Rows referencing the room are not handled: a foreign-key
  /// violation surfaces as pqxx::foreign_key_violation.
  int deleteById(int64_t iId);

 private:
  ConnectionFactory& _cfFactory;
};

}  // namespace roommates::dal
