#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "vault/core/v1.hpp"

using vault::identity::FromHex;
using vault::identity::HashKey;
using vault::identity::ToHex;

static void Usage() {
  std::cout << "vaultctl (api " << vault::core::v1::kApiVersion << ")\n"
            << "Usage:\n"
            << "  vaultctl [--config <file>] resolve <tenant> <business_key>\n"
            << "  vaultctl [--config <file>] ensure-hub <tenant> <business_key> [source]\n"
            << "  vaultctl [--config <file>] put <hash_key> <payload> [source]\n"
            << "  vaultctl [--config <file>] current <hash_key>\n"
            << "  vaultctl [--config <file>] history <hash_key>\n"
            << "  vaultctl [--config <file>] link <hash_key> <hash_key> [source]\n"
            << "  vaultctl [--config <file>] issue <actor_hk> [ttl_seconds] [fingerprint] [ip]\n"
            << "  vaultctl [--config <file>] validate <token> [fingerprint] [ip] [category]\n"
            << "  vaultctl [--config <file>] refresh <token> [threshold_seconds] [force]\n"
            << "  vaultctl [--config <file>] revoke <token> [reason]\n"
            << "  vaultctl [--config <file>] assign <actor_hk> <domain> [allow=a,b] [deny=a,b] [forbid=d,e] [perms=read,write,learn,inference]\n"
            << "  vaultctl [--config <file>] authorize <actor_hk> <domain> <read|write|learn|inference> [category]\n";
}

static std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream        ss(value);
  std::string              item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static std::string Arg(const std::vector<std::string>& args, size_t i, const std::string& fallback = {}) {
  return i < args.size() ? args[i] : fallback;
}

static void PrintVersion(const vault::version::Version& v) {
  std::cout << v.Id() << " from=" << vault::util::FormatIso(v.effective_from)
            << " to=" << (v.effective_to ? vault::util::FormatIso(*v.effective_to) : std::string("open")) << " source=" << v.record_source
            << " fingerprint=" << ToHex(v.fingerprint) << "\n"
            << "  " << v.payload << "\n";
}

static int Run(vault::factory::Runtime& rt, const std::string& cmd, const std::vector<std::string>& args) {
  const auto source = [&](size_t i) { return Arg(args, i, rt.default_record_source); };

  if (cmd == "resolve" && args.size() >= 2) {
    auto tenant = vault::identity::IdentityResolver::ResolveTenant(args[0]);
    std::cout << ToHex(vault::identity::IdentityResolver::Resolve(tenant, args[1])) << "\n";
    return 0;
  }

  if (cmd == "ensure-hub" && args.size() >= 2) {
    auto tenant = rt.identity->EnsureTenant(args[0], source(2));
    auto hub    = rt.identity->EnsureHub(tenant.hash_key, args[1], source(2));
    std::cout << ToHex(hub.hash_key) << (hub.created ? " created" : " existing") << "\n";
    return 0;
  }

  if (cmd == "put" && args.size() >= 2) {
    PrintVersion(rt.profiles->Put(FromHex(args[0]), args[1], source(2)));
    return 0;
  }

  if (cmd == "current" && args.size() >= 1) {
    auto current = rt.profiles->Current(FromHex(args[0]));
    if (!current) {
      std::cout << "no current version\n";
      return 3;
    }
    PrintVersion(*current);
    return 0;
  }

  if (cmd == "history" && args.size() >= 1) {
    for (const auto& v : rt.profiles->History(FromHex(args[0]))) {
      PrintVersion(v);
    }
    return 0;
  }

  if (cmd == "link" && args.size() >= 2) {
    std::cout << ToHex(rt.relationships->Link(FromHex(args[0]), FromHex(args[1]), source(2))) << "\n";
    return 0;
  }

  if (cmd == "issue" && args.size() >= 1) {
    vault::util::Micros ttl{0};
    if (args.size() >= 2) ttl = std::chrono::seconds(std::stoll(args[1]));
    auto session = rt.sessions->Issue(FromHex(args[0]), ttl, {.client_fingerprint = Arg(args, 2), .ip_address = Arg(args, 3)});
    std::cout << session.token << " expires=" << vault::util::FormatIso(session.expires_at) << "\n";
    return 0;
  }

  if (cmd == "validate" && args.size() >= 1) {
    vault::risk::RequestContext context{.client_fingerprint = Arg(args, 1), .ip_address = Arg(args, 2)};
    if (args.size() >= 4) context.data_categories.push_back(args[3]);

    auto result = rt.sessions->Validate(args[0], context);
    if (result.assessment) {
      std::cout << "score=" << result.assessment->score << " tier=" << vault::risk::ToString(result.assessment->tier) << "\n";
    }
    if (!result) {
      std::cout << "DENIED " << vault::access::ToString(*result.denied) << "\n";
      return 3;
    }
    std::cout << "ALLOWED\n";
    return 0;
  }

  if (cmd == "refresh" && args.size() >= 1) {
    vault::util::Micros threshold = std::chrono::minutes(2);
    if (args.size() >= 2) threshold = std::chrono::seconds(std::stoll(args[1]));

    auto result = rt.sessions->Refresh(args[0], threshold, Arg(args, 2) == "force");
    if (!result) {
      std::cout << "DENIED " << vault::access::ToString(*result.denied) << "\n";
      return 3;
    }
    std::cout << vault::session::ToString(*result.reason) << " " << result.session->token
              << " expires=" << vault::util::FormatIso(result.session->expires_at) << "\n";
    return 0;
  }

  if (cmd == "revoke" && args.size() >= 1) {
    bool changed = rt.sessions->Revoke(args[0], Arg(args, 1, "revoked by operator"));
    std::cout << (changed ? "revoked" : "already terminal") << "\n";
    return 0;
  }

  if (cmd == "assign" && args.size() >= 2) {
    vault::domain::Assignment assignment;
    assignment.domain     = args[1];
    assignment.granted_by = rt.default_record_source;
    for (size_t i = 2; i < args.size(); ++i) {
      const auto& opt = args[i];
      auto        eq  = opt.find('=');
      if (eq == std::string::npos) {
        std::cerr << "invalid option: " << opt << "\n";
        return 1;
      }
      auto key    = opt.substr(0, eq);
      auto values = SplitList(opt.substr(eq + 1));
      if (key == "allow") {
        assignment.allowed_categories = values;
      } else if (key == "deny") {
        assignment.denied_categories = values;
      } else if (key == "forbid") {
        assignment.forbidden_domains = values;
      } else if (key == "perms") {
        assignment.permissions = {};
        assignment.permissions.read = false;
        for (const auto& p : values) {
          auto action = vault::access::ParseAction(p);
          if (!action) {
            std::cerr << "invalid permission: " << p << "\n";
            return 1;
          }
          switch (*action) {
            case vault::access::Action::kRead: assignment.permissions.read = true; break;
            case vault::access::Action::kWrite: assignment.permissions.write = true; break;
            case vault::access::Action::kLearn: assignment.permissions.learn = true; break;
            case vault::access::Action::kInference: assignment.permissions.inference = true; break;
          }
        }
      } else {
        std::cerr << "invalid option: " << opt << "\n";
        return 1;
      }
    }

    auto stored = rt.domains->Assign(FromHex(args[0]), std::move(assignment), rt.default_record_source);
    std::cout << "assigned " << stored.domain << " link=" << ToHex(stored.link_hk) << "\n";
    return 0;
  }

  if (cmd == "authorize" && args.size() >= 3) {
    auto action = vault::access::ParseAction(args[2]);
    if (!action) {
      std::cerr << "invalid action: " << args[2] << "\n";
      return 1;
    }
    auto decision = rt.domains->Authorize(FromHex(args[0]), args[1], *action, Arg(args, 3));
    if (!decision) {
      std::cout << "DENIED " << vault::access::ToString(*decision.reason) << "\n";
      return 3;
    }
    std::cout << "ALLOWED\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> argv_list(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (argv_list.size() >= 2 && argv_list[0] == "--config") {
    config_path = argv_list[1];
    argv_list.erase(argv_list.begin(), argv_list.begin() + 2);
  }
  if (argv_list.empty()) {
    Usage();
    return 1;
  }

  const std::string        cmd = argv_list[0];
  std::vector<std::string> args(argv_list.begin() + 1, argv_list.end());

  try {
    auto config = config_path ? vault::config::ConfigLoader::LoadFromYaml(*config_path) : vault::config::ConfigLoader::Defaults();
    auto rt     = vault::factory::Build(config);

    int rc = Run(rt, cmd, args);
    rt.audit->Flush();
    vault::observability::ShutdownLogging();
    return rc;
  } catch (const vault::util::ValidationError& e) {
    std::cerr << "invalid input: " << e.what() << "\n";
    return 1;
  } catch (const vault::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 3;
  } catch (const vault::util::LockedOut& e) {
    std::cerr << "locked out: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("Fatal error", {vault::observability::StringField("error", e.what())});
    vault::observability::ShutdownLogging();
    return 2;
  }
}
