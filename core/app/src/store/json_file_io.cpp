#include "capguard/store/json_file_io.hpp"

#include "capguard/store/store_error.hpp"

#include <fstream>
#include <system_error>

namespace capguard {

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      throw StoreUnavailableError("cannot stat " + path.string() + ": " +
                                  ec.message());
    }
    return std::nullopt;
  }

  std::ifstream in(path);
  if (!in) {
    throw StoreUnavailableError("cannot open " + path.string());
  }

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw StoreUnavailableError("corrupt JSON in " + path.string() + ": " +
                                e.what());
  }
}

void writeJsonFileAtomic(const std::filesystem::path& path,
                         const nlohmann::json& doc) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw StoreUnavailableError("cannot write " + tmp.string());
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
      throw StoreUnavailableError("short write to " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw StoreUnavailableError("cannot replace " + path.string());
  }
}

}  // namespace capguard
