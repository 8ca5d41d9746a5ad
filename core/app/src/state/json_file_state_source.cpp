#include "capguard/state/json_file_state_source.hpp"

#include "capguard/serialization/json_codec.hpp"
#include "capguard/store/json_file_io.hpp"
#include "capguard/store/store_error.hpp"

#include <utility>

namespace capguard {

JsonFileStateSource::JsonFileStateSource(std::filesystem::path path)
    : path_(std::move(path)) {}

domain::CapitalInputs JsonFileStateSource::load() const {
  auto doc = readJsonFile(path_);
  if (!doc) {
    throw StoreUnavailableError("capital state file not found: " +
                                path_.string());
  }
  try {
    return doc->get<domain::CapitalInputs>();
  } catch (const nlohmann::json::exception& e) {
    throw StoreUnavailableError("malformed capital state in " +
                                path_.string() + ": " + e.what());
  } catch (const CodecError& e) {
    throw StoreUnavailableError("malformed capital state in " +
                                path_.string() + ": " + e.what());
  }
}

}  // namespace capguard
