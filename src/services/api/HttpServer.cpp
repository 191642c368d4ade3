#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>

#include "core/Errors.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/metadata/RecordJson.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static std::optional<int64_t> param_i64(const httplib::Request& req, const char* k) {
  const std::string s = param_or(req, k);
  if (s.empty()) return std::nullopt;
  size_t used = 0;
  int64_t v = 0;
  try {
    v = std::stoll(s, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != s.size()) {
    throw zipcat::CatalogError(zipcat::ErrorCode::InvalidQuery, std::string(k) + " must be an integer");
  }
  return v;
}

static void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, const std::exception& e) {
  int status = 500;
  std::string code = "Internal";
  if (auto* ce = dynamic_cast<const zipcat::CatalogError*>(&e)) {
    code = zipcat::to_string(ce->code());
    if (ce->code() == zipcat::ErrorCode::InvalidQuery) status = 400;
    else if (ce->code() == zipcat::ErrorCode::NotFound) status = 404;
  }
  if (status == 500) spdlog::error("request failed: {}", e.what());
  send_json(res, {{"error", code}, {"message", e.what()}}, status);
}

static zipcat::QueryFilter filter_from(const httplib::Request& req) {
  zipcat::QueryFilter f;
  if (auto q = param_or(req, "q"); !q.empty()) f.name = q;
  if (auto r = param_or(req, "regex"); !r.empty()) f.regex = r;
  if (auto a = param_or(req, "archive_id"); !a.empty()) f.archive_id = a;
  f.min_size = param_i64(req, "min_size");
  f.max_size = param_i64(req, "max_size");
  f.limit    = param_i64(req, "limit");

  std::stringstream cats(param_or(req, "categories"));
  std::string c;
  while (std::getline(cats, c, ',')) {
    if (c.empty()) continue;
    try {
      f.categories.insert(zipcat::category_from_string(c));
    } catch (const std::invalid_argument& e) {
      throw zipcat::CatalogError(zipcat::ErrorCode::InvalidQuery, e.what());
    }
  }
  return f;
}

// -------- server --------

namespace zipcat {

void register_routes(httplib::Server& svr, const CatalogStore& store, const std::string& apiKey) {
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /search?q=&regex=&min_size=&max_size=&categories=video,image&limit=
  svr.Get("/search", [&store, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      const auto matches = store.query(filter_from(req));
      send_json(res, {{"count", matches.size()}, {"results", toJson(matches)}});
    } catch (const std::exception& e) {
      send_error(res, e);
    }
  });

  svr.Get("/archives", [&store, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      json arr = json::array();
      for (const auto& l : store.listArchives(param_i64(req, "limit"))) arr.push_back(toJson(l));
      send_json(res, arr);
    } catch (const std::exception& e) {
      send_error(res, e);
    }
  });

  svr.Get(R"(/archives/([0-9a-fA-F-]+))", [&store, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      const std::string id = req.matches[1];
      auto a = store.archive(id);
      if (!a) throw CatalogError(ErrorCode::NotFound, "no archive with id " + id);
      QueryFilter f;
      f.archive_id = id;
      json entries = json::array();
      for (const auto& m : store.query(f)) entries.push_back(toJson(m.entry));
      json out = toJson(*a);
      out["entries"] = entries;
      send_json(res, out);
    } catch (const std::exception& e) {
      send_error(res, e);
    }
  });

  svr.Get("/stats", [&store, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      send_json(res, toJson(store.stats()));
    } catch (const std::exception& e) {
      send_error(res, e);
    }
  });

  svr.Get("/volumes", [&store, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      json arr = json::array();
      for (const auto& v : store.volumeStats()) arr.push_back(toJson(v));
      send_json(res, arr);
    } catch (const std::exception& e) {
      send_error(res, e);
    }
  });

  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

void run_http_server(const CatalogStore& store, int port, const std::string& apiKey) {
  httplib::Server svr;
  register_routes(svr, store, apiKey);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    throw std::runtime_error("failed to bind port " + std::to_string(port));
  }
}

} // namespace zipcat
