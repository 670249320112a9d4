#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "registry/v1.hpp"

using namespace registry::v1;

namespace {

constexpr int kExitUsage        = 1;
constexpr int kExitFatal        = 2;
constexpr int kExitRegistryBase = 10;

void Usage() {
  std::cerr << "Usage:\n"
            << "  registryctl --config <file.yaml> --caller <principal> [--height <n>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  create <name> <size_bytes> <description> <tag[,tag...]>\n"
            << "  update <asset_id> <name> <size_bytes> <description> <tag[,tag...]>\n"
            << "  transfer <asset_id> <new_owner>\n"
            << "  delete <asset_id>\n"
            << "  info <asset_id>\n"
            << "  access <asset_id> <principal>\n"
            << "  owner <asset_id>\n"
            << "  stats\n";
}

std::optional<uint64_t> ParseU64(const std::string& value) {
  uint64_t parsed = 0;
  const auto* begin = value.data();
  const auto* end   = value.data() + value.size();
  auto [ptr, ec]    = std::from_chars(begin, end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

// "a,b,c" -> {"a","b","c"}. Empty items are kept so validation can reject them.
std::vector<std::string> SplitTags(const std::string& value) {
  std::vector<std::string> tags;
  if (value.empty()) {
    return tags;
  }
  std::string::size_type start = 0;
  while (true) {
    const auto comma = value.find(',', start);
    tags.push_back(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return tags;
}

void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render result: " + std::string(status.message()));
  }
  std::cout << json;
}

template <typename Request>
void FillFields(Request* req, const std::string& name, uint64_t size_bytes, const std::string& description, const std::string& tags) {
  req->set_name(name);
  req->set_size_bytes(size_bytes);
  req->set_description(description);
  for (auto& tag : SplitTags(tags)) {
    req->add_tags(std::move(tag));
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string             config_path;
  std::string             caller;
  std::optional<uint64_t> height;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--caller" && i + 1 < argc) {
      caller = argv[++i];
    } else if (arg == "--height" && i + 1 < argc) {
      height = ParseU64(argv[++i]);
      if (!height) {
        std::cerr << "invalid --height: " << argv[i] << "\n";
        return kExitUsage;
      }
    } else {
      break;
    }
  }

  if (config_path.empty() || caller.empty() || i >= argc) {
    Usage();
    return kExitUsage;
  }

  const std::string              cmd = argv[i++];
  const std::vector<std::string> args(argv + i, argv + argc);

  try {
    auto config = registry::config::ConfigLoader::LoadFromYaml(config_path);
    registry::observability::InitializeLogging(config);

    auto  app     = registry::factory::Build(config);
    auto& service = *app.registry_service;

    CallContext context;
    context.set_caller(caller);
    context.set_block_height(height.value_or(registry::util::ToUnixSeconds(registry::util::Now())));

    // ------------------------------------------------------------

    if (cmd == "create" && args.size() == 4) {
      const auto size_bytes = ParseU64(args[1]);
      if (!size_bytes) {
        std::cerr << "invalid size_bytes: " << args[1] << "\n";
        return kExitUsage;
      }

      CreateAssetRequest req;
      *req.mutable_context() = context;
      FillFields(&req, args[0], *size_bytes, args[2], args[3]);
      PrintJson(service.CreateAsset(req));

    } else if (cmd == "update" && args.size() == 5) {
      const auto asset_id   = ParseU64(args[0]);
      const auto size_bytes = ParseU64(args[2]);
      if (!asset_id || !size_bytes) {
        std::cerr << "invalid asset_id or size_bytes\n";
        return kExitUsage;
      }

      UpdateAssetRequest req;
      *req.mutable_context() = context;
      req.set_asset_id(*asset_id);
      FillFields(&req, args[1], *size_bytes, args[3], args[4]);
      PrintJson(service.UpdateAsset(req));

    } else if (cmd == "transfer" && args.size() == 2) {
      const auto asset_id = ParseU64(args[0]);
      if (!asset_id) {
        std::cerr << "invalid asset_id: " << args[0] << "\n";
        return kExitUsage;
      }

      TransferOwnershipRequest req;
      *req.mutable_context() = context;
      req.set_asset_id(*asset_id);
      req.set_new_owner(args[1]);
      PrintJson(service.TransferOwnership(req));

    } else if ((cmd == "delete" || cmd == "info" || cmd == "owner") && args.size() == 1) {
      const auto asset_id = ParseU64(args[0]);
      if (!asset_id) {
        std::cerr << "invalid asset_id: " << args[0] << "\n";
        return kExitUsage;
      }

      if (cmd == "delete") {
        DeleteAssetRequest req;
        *req.mutable_context() = context;
        req.set_asset_id(*asset_id);
        PrintJson(service.DeleteAsset(req));
      } else if (cmd == "info") {
        GetAssetInformationRequest req;
        *req.mutable_context() = context;
        req.set_asset_id(*asset_id);
        PrintJson(service.GetAssetInformation(req));
      } else {
        GetAssetOwnerRequest req;
        *req.mutable_context() = context;
        req.set_asset_id(*asset_id);
        PrintJson(service.GetAssetOwner(req));
      }

    } else if (cmd == "access" && args.size() == 2) {
      const auto asset_id = ParseU64(args[0]);
      if (!asset_id) {
        std::cerr << "invalid asset_id: " << args[0] << "\n";
        return kExitUsage;
      }

      VerifyAccessStatusRequest req;
      *req.mutable_context() = context;
      req.set_asset_id(*asset_id);
      req.set_principal(args[1]);
      PrintJson(service.VerifyAccessStatus(req));

    } else if (cmd == "stats" && args.empty()) {
      GetRegistryStatisticsRequest req;
      *req.mutable_context() = context;
      PrintJson(service.GetRegistryStatistics(req));

    } else {
      Usage();
      return kExitUsage;
    }

    registry::observability::ShutdownLogging();
  } catch (const registry::util::RegistryError& e) {
    std::cerr << registry::util::ErrorKindName(e.Kind()) << ": " << e.what() << "\n";
    registry::observability::ShutdownLogging();
    return kExitRegistryBase + static_cast<int>(e.Code() - static_cast<uint32_t>(registry::util::ErrorKind::InsufficientPrivileges));
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Fatal error", {registry::observability::StringField("error", e.what())});
    registry::observability::ShutdownLogging();
    return kExitFatal;
  }

  return 0;
}
