#include <drogon/drogon.h>
#include <nlohmann/json.hpp>
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <json/json.h>
#include <trantor/net/EventLoop.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "engine.hpp"
#include "report.hpp"
#include "session.hpp"
#include "util.hpp"

using namespace honeypot;

static json fromJsoncpp(const Json::Value &v) {
    switch (v.type()) {
    case Json::nullValue: return nullptr;
    case Json::intValue: return (int64_t)v.asInt64();
    case Json::uintValue: return (uint64_t)v.asUInt64();
    case Json::realValue: return v.asDouble();
    case Json::stringValue: return v.asString();
    case Json::booleanValue: return v.asBool();
    case Json::arrayValue: {
        json out = json::array();
        for (const auto &item : v) out.push_back(fromJsoncpp(item));
        return out;
    }
    case Json::objectValue: {
        json out = json::object();
        for (auto it = v.begin(); it != v.end(); ++it) {
            out[it.name()] = fromJsoncpp(*it);
        }
        return out;
    }
    default:
        return nullptr;
    }
}

static Json::Value toJsoncpp(const json &v) {
    if (v.is_null()) return Json::Value();
    if (v.is_boolean()) return Json::Value(v.get<bool>());
    if (v.is_number_integer()) return Json::Value((Json::Int64)v.get<long long>());
    if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
    if (v.is_number_float()) return Json::Value(v.get<double>());
    if (v.is_string()) return Json::Value(v.get<std::string>());
    if (v.is_array()) {
        Json::Value arr(Json::arrayValue);
        for (const auto &item : v) arr.append(toJsoncpp(item));
        return arr;
    }
    if (v.is_object()) {
        Json::Value obj(Json::objectValue);
        for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
        return obj;
    }
    return Json::Value();
}

static std::string getEnv(const std::string &key, const std::string &fallback = "") {
    const char *v = std::getenv(key.c_str());
    if (!v) return fallback;
    return std::string(v);
}

static bool boolFrom(const std::string &value, bool fallback = true) {
    std::string v = toLowerAscii(trimCopy(value));
    if (v.empty()) return fallback;
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

static double numberOr(const std::string &s, double fallback) {
    std::string t = trimCopy(s);
    if (t.empty()) return fallback;
    try {
        size_t idx = 0;
        double v = std::stod(t, &idx);
        if (idx != t.size() || !std::isfinite(v)) return fallback;
        return v;
    } catch (const std::exception &) {
        return fallback;
    }
}

static std::map<std::string, std::string> parseArgs(int argc, char **argv) {
    std::map<std::string, std::string> out;
    for (int i = 1; i < argc; i++) {
        std::string item = argv[i];
        if (item.rfind("--", 0) != 0) continue;
        auto pos = item.find('=');
        if (pos == std::string::npos) {
            out[item.substr(2)] = "true";
        } else {
            out[item.substr(2, pos - 2)] = item.substr(pos + 1);
        }
    }
    return out;
}

struct Config {
    std::string host{"0.0.0.0"};
    int port{8000};
    std::string apiKey{"dev-honeypot-key"};
    bool authEnabled{true};
    std::string jwtSecret{"dev-secret-change-me"};
    int jwtTtlSec{3600};
    std::string callbackUrl;
    int callbackRetries{3};
    int callbackTimeoutMs{10000};
    int sessionTtlSec{3600};
    int cleanupIntervalSec{600};
    std::string paramsFile;
    int threads{4};
};

static Config loadConfig(int argc, char **argv) {
    const auto args = parseArgs(argc, argv);
    auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
        auto it = args.find(argKey);
        if (it != args.end() && !it->second.empty()) return it->second;
        std::string v = getEnv(env);
        if (!v.empty()) return v;
        return def;
    };

    Config c;
    c.host = argOrEnv("host", "HONEYPOT_HOST", "0.0.0.0");
    c.port = (int)numberOr(argOrEnv("port", "HONEYPOT_PORT", "8000"), 8000);
    c.apiKey = argOrEnv("api-key", "HONEYPOT_API_KEY", "dev-honeypot-key");
    c.authEnabled = boolFrom(argOrEnv("auth", "HONEYPOT_AUTH_ENABLED", "true"), true);
    c.jwtSecret = argOrEnv("jwt-secret", "HONEYPOT_JWT_SECRET", "dev-secret-change-me");
    c.jwtTtlSec = std::max(60, (int)numberOr(argOrEnv("jwt-ttl-sec", "HONEYPOT_JWT_TTL_SEC", "3600"), 3600));
    c.callbackUrl = argOrEnv("callback-url", "HONEYPOT_CALLBACK_URL", "");
    c.callbackRetries = std::max(1, (int)numberOr(argOrEnv("callback-retries", "HONEYPOT_CALLBACK_RETRIES", "3"), 3));
    c.callbackTimeoutMs = std::max(100, (int)numberOr(argOrEnv("callback-timeout-ms", "HONEYPOT_CALLBACK_TIMEOUT_MS", "10000"), 10000));
    c.sessionTtlSec = std::max(1, (int)numberOr(argOrEnv("session-ttl-sec", "HONEYPOT_SESSION_TTL_SEC", "3600"), 3600));
    c.cleanupIntervalSec = std::max(1, (int)numberOr(argOrEnv("cleanup-interval-sec", "HONEYPOT_CLEANUP_INTERVAL_SEC", "600"), 600));
    c.paramsFile = argOrEnv("params", "HONEYPOT_PARAMS", "");
    c.threads = std::max(1, (int)numberOr(argOrEnv("threads", "HONEYPOT_THREADS", "4"), 4));
    return c;
}

static bool loadParamsFile(const std::string &path, json &out, std::string &error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        out = json::parse(ss.str());
    } catch (const std::exception &e) {
        error = e.what();
        return false;
    }
    if (!out.is_object()) {
        error = "params file must hold a JSON object";
        return false;
    }
    return true;
}

class HoneypotServer {
public:
    HoneypotServer(std::shared_ptr<EngagementEngine> engine, std::shared_ptr<SessionStore> sessions,
                   std::shared_ptr<ReportDispatcher> reports, const Config &config)
        : engine_(std::move(engine)), sessions_(std::move(sessions)), reports_(std::move(reports)), config_(config) {
        startedAt_ = std::chrono::steady_clock::now();
        setupRoutes();
    }

    void listen() {
        auto loop = drogon::app().getLoop();
        auto sessions = sessions_;
        loop->runEvery((double)config_.cleanupIntervalSec, [sessions]() {
            size_t evicted = sessions->evictIdle(nowEpochMs());
            if (evicted) std::cerr << "[Sessions] evicted " << evicted << " idle session(s), " << sessions->size() << " active" << std::endl;
        });
        std::cout << "[Bootstrap] listening on " << config_.host << ":" << config_.port << " with " << config_.threads << " thread(s)" << std::endl;
        drogon::app().setThreadNum((size_t)config_.threads);
        drogon::app().addListener(config_.host, (uint16_t)config_.port);
        drogon::app().run();
    }

private:
    using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

    std::shared_ptr<EngagementEngine> engine_;
    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<ReportDispatcher> reports_;
    Config config_;
    std::chrono::steady_clock::time_point startedAt_;
    std::atomic<int64_t> turnsServed_{0};
    struct AuthError { std::string error; std::string message; };

    json parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const {
        ok = true;
        auto payload = req->getJsonObject();
        if (payload) return fromJsoncpp(*payload);
        auto body = req->getBody();
        if (body.empty()) return json::object();
        try {
            return json::parse(std::string(body));
        } catch (const std::exception &) {
            ok = false;
            return json();
        }
    }

    bool apiKeyOK(const drogon::HttpRequestPtr &req) const {
        const std::string key = req->getHeader("x-api-key");
        return !key.empty() && key == config_.apiKey;
    }

    bool bearerOK(const drogon::HttpRequestPtr &req, AuthError &err) const {
        auto auth = req->getHeader("authorization");
        std::string token;
        std::regex re("^Bearer\\s+(.+)$", std::regex::icase);
        std::smatch m;
        if (std::regex_match(auth, m, re) && m.size() >= 2) token = m[1].str();
        if (token.empty()) {
            err = {"unauthorized", ""};
            return false;
        }
        try {
            auto dec = jwt::decode<jwt::traits::nlohmann_json>(token);
            jwt::verify<jwt::traits::nlohmann_json>()
                .allow_algorithm(jwt::algorithm::hs256{config_.jwtSecret})
                .with_issuer("honeypot")
                .verify(dec);
            return true;
        } catch (const std::exception &e) {
            err = {"invalid-token", e.what()};
            return false;
        }
    }

    bool authOK(const drogon::HttpRequestPtr &req, AuthError &err) const {
        if (!config_.authEnabled) return true;
        if (apiKeyOK(req)) return true;
        if (!req->getHeader("x-api-key").empty()) {
            err = {"invalid-api-key", ""};
            return false;
        }
        return bearerOK(req, err);
    }

    std::string issueToken() const {
        auto now = std::chrono::system_clock::now();
        return jwt::create<jwt::traits::nlohmann_json>()
            .set_issuer("honeypot")
            .set_type("JWT")
            .set_issued_at(now)
            .set_expires_at(now + std::chrono::seconds(config_.jwtTtlSec))
            .sign(jwt::algorithm::hs256{config_.jwtSecret});
    }

    static std::string messageText(const json &message) {
        if (message.is_string()) return message.get<std::string>();
        if (message.is_object()) {
            auto it = message.find("text");
            if (it != message.end() && it->is_string()) return it->get<std::string>();
        }
        return "";
    }

    // Earlier scammer turns supplied by the transport for a session this
    // process has not seen yet.
    static std::vector<std::string> scammerHistory(const json &body) {
        std::vector<std::string> out;
        auto it = body.find("conversationHistory");
        if (it == body.end() || !it->is_array()) return out;
        for (const auto &item : *it) {
            if (!item.is_object()) continue;
            std::string sender = toLowerAscii(item.value("sender", std::string("scammer")));
            if (sender != "scammer") continue;
            std::string text = messageText(item);
            if (!text.empty()) out.push_back(text);
        }
        return out;
    }

    void setupRoutes() {
        drogon::app().registerHandler("/", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            respondHealth(cb);
        }, {drogon::Get});
        drogon::app().registerHandler("/health", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            respondHealth(cb);
        }, {drogon::Get});

        drogon::app().registerHandler("/honeypot", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            AuthError authErr;
            if (!authOK(req, authErr)) return unauthorized(cb, authErr);
            try {
                bool ok = true;
                json body = parseRequestBody(req, ok);
                if (!ok || !body.is_object()) return badRequest(cb, "invalid json");
                std::string sessionId = sanitizeUtf8(trimCopy(body.value("sessionId", std::string())));
                if (sessionId.empty()) return badRequest(cb, "sessionId required");
                const std::string text = messageText(body.contains("message") ? body["message"] : json());
                const auto history = scammerHistory(body);

                TurnResult result;
                json report;
                // Finalization is claimed while the entry is held.
                sessions_->withSession(sessionId, [&](SessionState &state, bool fresh) {
                    if (fresh && !history.empty()) {
                        engine_->replayHistory(state, history);
                        std::cerr << "[Server] session " << sessionId << " replayed " << history.size() << " history message(s)" << std::endl;
                    }
                    result = engine_->processTurn(state, text);
                    if (result.readyToReport && SessionStore::markFinalized(state)) {
                        report = buildReportPayload(state, nowEpochMs(), engine_->params().scamThreshold);
                    }
                });
                turnsServed_++;

                if (!report.is_null()) {
                    std::cerr << "[Server] session " << sessionId << " ready to report, dispatching" << std::endl;
                    reports_->enqueue(sessionId, std::move(report));
                }

                json out{{"status", "success"}, {"reply", result.reply}};
                if (engine_->params().enableDiagnostics) out["engine"] = result.toJson();
                respondJson(cb, out);
            } catch (const std::exception &e) {
                std::cerr << "[Server] /honeypot failed: " << e.what() << std::endl;
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/auth/token", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            try {
                bool ok = true;
                json body = parseRequestBody(req, ok);
                if (!ok) return badRequest(cb, "invalid json");
                std::string key = req->getHeader("x-api-key");
                if (key.empty() && body.is_object()) key = body.value("apiKey", std::string());
                if (key.empty() || key != config_.apiKey) return unauthorized(cb, AuthError{"invalid-api-key", ""});
                respondJson(cb, json{{"ok", true}, {"token", issueToken()}, {"expiresIn", config_.jwtTtlSec}});
            } catch (const std::exception &e) {
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/api/sessions/{id}", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
            AuthError authErr;
            if (!authOK(req, authErr)) return unauthorized(cb, authErr);
            try {
                json snap;
                std::string error;
                if (!sessions_->snapshot(id, snap, &error)) {
                    respondJson(cb, json{{"ok", false}, {"error", error}}, drogon::k404NotFound);
                    return;
                }
                respondJson(cb, json{{"ok", true}, {"session", snap}});
            } catch (const std::exception &e) {
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Get});

        drogon::app().registerHandler("/api/params", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            AuthError authErr;
            if (!authOK(req, authErr)) return unauthorized(cb, authErr);
            if (req->method() == drogon::Get) {
                respondJson(cb, json{{"ok", true}, {"params", engine_->params().toJson()}});
                return;
            }
            try {
                bool ok = true;
                json patch = parseRequestBody(req, ok);
                if (!ok || !patch.is_object()) return badRequest(cb, "invalid json");
                std::string error;
                if (!engine_->applyParams(patch, &error)) return badRequest(cb, error);
                std::cerr << "[Server] params updated: " << patch.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
                respondJson(cb, json{{"ok", true}, {"params", engine_->params().toJson()}});
            } catch (const std::exception &e) {
                std::cerr << "[Server] /api/params failed: " << e.what() << std::endl;
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Get, drogon::Post});

        drogon::app().registerHandler("/api/reports", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            AuthError authErr;
            if (!authOK(req, authErr)) return unauthorized(cb, authErr);
            respondJson(cb, json{{"ok", true}, {"delivered", reports_->delivered()}, {"failed", reports_->failed()},
                                 {"callbackConfigured", !config_.callbackUrl.empty()}});
        }, {drogon::Get});
    }

    void respondHealth(const Callback &cb) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_).count();
        respondJson(cb, json{{"status", "online"}, {"service", "honeypot"}, {"sessions", sessions_->size()},
                             {"uptimeSec", (int64_t)uptime}, {"turnsServed", turnsServed_.load()}});
    }

    void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
        resp->setStatusCode(code);
        cb(resp);
    }

    void unauthorized(const Callback &cb, const AuthError &err) {
        json payload{{"ok", false}, {"error", err.error.empty() ? std::string("unauthorized") : err.error}};
        if (!err.message.empty()) payload["message"] = err.message;
        respondJson(cb, payload, drogon::k401Unauthorized);
    }

    void badRequest(const Callback &cb, const std::string &msg) {
        respondJson(cb, json{{"ok", false}, {"error", msg}}, drogon::k400BadRequest);
    }
};

int main(int argc, char **argv) {
    const auto config = loadConfig(argc, argv);

    auto engine = std::make_shared<EngagementEngine>();
    if (!config.paramsFile.empty()) {
        json patch;
        std::string error;
        if (!loadParamsFile(config.paramsFile, patch, error) || !engine->applyParams(patch, &error)) {
            std::cerr << "[Bootstrap] params file " << config.paramsFile << " rejected: " << error << std::endl;
            return 2;
        }
        std::cout << "[Bootstrap] params loaded from " << config.paramsFile << std::endl;
    }
    std::cout << "[Bootstrap] engine ready: " << engine->catalog().size() << " canned replies, threshold "
              << engine->params().scamThreshold << std::endl;

    auto sessions = std::make_shared<SessionStore>((int64_t)config.sessionTtlSec * 1000);
    auto reports = std::make_shared<ReportDispatcher>(std::make_shared<CurlReportSender>(), config.callbackUrl,
                                                      config.callbackRetries, config.callbackTimeoutMs);
    if (config.callbackUrl.empty()) {
        std::cout << "[Bootstrap] no callback url configured, final reports will not be delivered" << std::endl;
    } else {
        reports->start();
        std::cout << "[Bootstrap] reports go to " << config.callbackUrl << std::endl;
    }
    if (!config.authEnabled) std::cout << "[Bootstrap] authentication disabled" << std::endl;

    HoneypotServer server(engine, sessions, reports, config);
    server.listen();
    reports->stop();
    return 0;
}
