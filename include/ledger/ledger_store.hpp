#pragma once
#include <string>
#include <nlohmann/json.hpp>

class UserLedger;

// JSON snapshot of a UserLedger. Amounts are decimal strings of integer units.
namespace LedgerStore {
  nlohmann::json ToJson(const UserLedger& ledger);
  // Replaces ledger contents; throws std::runtime_error on a malformed document
  void FromJson(const nlohmann::json& doc, UserLedger& ledger);
  // Atomic save: write <path>.tmp then rename over path
  void Save(const UserLedger& ledger, const std::string& path);
  // Missing file leaves the ledger empty and returns false
  bool Load(const std::string& path, UserLedger& ledger);
}
