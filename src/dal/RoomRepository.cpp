#include "dal/RoomRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionFactory.hpp"

#include <pqxx/pqxx>

#include <utility>

namespace roommates::dal {

RoomRepository::RoomRepository(ConnectionFactory& cfFactory) : _cfFactory(cfFactory) {}
RoomRepository::~RoomRepository() = default;

void RoomRepository::insert(RoomRow& room) {
  auto cg = _cfFactory.open();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "INSERT INTO Room (Name, MaxOccupancy) VALUES ($1, $2) RETURNING Id",
      pqxx::params{room.sName, room.iMaxOccupancy});
  txn.commit();

  room.iId = result.one_row()[0].as<int64_t>();
  common::Logger::get()->debug("Inserted room id={} name='{}'", room.iId, room.sName);
}

std::optional<RoomRow> RoomRepository::findById(int64_t iId) {
  auto cg = _cfFactory.open();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT Name, MaxOccupancy FROM Room WHERE Id = $1",
      pqxx::params{iId});
  txn.commit();

  if (result.empty()) return std::nullopt;

  auto [sName, iMaxOccupancy] = result[0].as<std::string, int>();
  return RoomRow{iId, std::move(sName), iMaxOccupancy};
}

std::vector<RoomRow> RoomRepository::listAll() {
  auto cg = _cfFactory.open();
  pqxx::work txn(*cg);
  auto result = txn.exec("SELECT Id, Name, MaxOccupancy FROM Room");
  txn.commit();

  std::vector<RoomRow> vRooms;
  vRooms.reserve(result.size());
  for (const auto& row : result) {
    auto [iId, sName, iMaxOccupancy] = row.as<int64_t, std::string, int>();
    vRooms.push_back(RoomRow{iId, std::move(sName), iMaxOccupancy});
  }
  return vRooms;
}

int RoomRepository::update(const RoomRow& room) {
  auto cg = _cfFactory.open();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE Room SET Name = $1, MaxOccupancy = $2 WHERE Id = $3",
      pqxx::params{room.sName, room.iMaxOccupancy, room.iId});
  txn.commit();

  const int iAffected = static_cast<int>(result.affected_rows());
  if (iAffected == 0) {
    common::Logger::get()->debug("Update matched no room with id={}", room.iId);
  }
  return iAffected;
}

int RoomRepository::deleteById(int64_t iId) {
  auto cg = _cfFactory.open();
  pqxx::work txn(*cg);
  auto result = txn.exec("DELETE FROM Room WHERE Id = $1", pqxx::params{iId});
  txn.commit();

  const int iAffected = static_cast<int>(result.affected_rows());
  if (iAffected == 0) {
    common::Logger::get()->debug("Delete matched no room with id={}", iId);
  }
  return iAffected;
}

}  // namespace roommates::dal
