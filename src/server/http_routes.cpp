#include "server/http_routes.hpp"

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace runbox::server {
namespace {

constexpr const char* kJson = "application/json";

void Reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(2), kJson);
}

void ReplyError(httplib::Response& res, const Error& error) {
    Reply(res, StatusFor(error.kind), {{"error", error.message}});
}

nlohmann::json SummaryJson(const std::optional<session::TestSummary>& summary) {
    if (!summary) {
        return nullptr;
    }
    return {
        {"passed", summary->passed},
        {"failed", summary->failed},
        {"total", summary->total},
        {"duration", summary->duration}
    };
}

int StatusForTestRun(const std::string& status) {
    if (status == "success") {
        return 200;
    }
    if (status == "partial_success") {
        return 206;
    }
    return 400;
}

}  // namespace

int StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidation: return 400;
        case ErrorKind::kNotFound: return 404;
        case ErrorKind::kRuntimeCreation:
        case ErrorKind::kStaging:
        case ErrorKind::kDispatch:
        case ErrorKind::kReclaim:
            return 500;
    }
    return 500;
}

std::vector<sandbox::SourceFile> UploadedFiles(const httplib::Request& req, const std::string& field) {
    std::vector<sandbox::SourceFile> files;
    for (const auto& item : req.get_file_values(field)) {
        files.push_back(sandbox::SourceFile{item.filename, item.content});
    }
    return files;
}

void HandleExecute(executor::ExecutionDispatcher& dispatcher, const httplib::Request& req, httplib::Response& res) {
    const auto result = dispatcher.SubmitScript(UploadedFiles(req, "file"));
    if (result.error) {
        ReplyError(res, *result.error);
        return;
    }
    Reply(res, 200, {{"session_id", result.session_id}});
}

void HandleExecuteTests(executor::ExecutionDispatcher& dispatcher, const httplib::Request& req, httplib::Response& res) {
    const auto response = dispatcher.SubmitTests(UploadedFiles(req, "files"));
    if (response.error) {
        if (response.error->kind == ErrorKind::kValidation) {
            ReplyError(res, *response.error);
            return;
        }
        Reply(res, StatusFor(response.error->kind), {
            {"error", response.error->message},
            {"status", "failure"},
            {"exit_code", -1}
        });
        return;
    }
    Reply(res, StatusForTestRun(response.result.status), {
        {"status", response.result.status},
        {"exit_code", response.result.exit_code},
        {"summary", SummaryJson(response.result.summary)},
        {"raw_output", response.result.raw_output},
        {"session_id", response.session_id}
    });
}

void HandleResult(executor::ExecutionDispatcher& dispatcher, const std::string& session_id, httplib::Response& res) {
    const auto result = dispatcher.Poll(session_id);
    if (result.error) {
        ReplyError(res, *result.error);
        return;
    }
    if (result.running) {
        Reply(res, 202, {{"status", "running"}});
        return;
    }
    Reply(res, 200, {{"logs", result.logs}});
}

void HandleCleanup(executor::ExecutionDispatcher& dispatcher, const std::string& session_id, httplib::Response& res) {
    const auto result = dispatcher.Cleanup(session_id);
    if (result.error) {
        ReplyError(res, *result.error);
        return;
    }
    Reply(res, 200, {{"status", result.status}});
}

void HandlePrewarm(executor::ExecutionDispatcher& dispatcher, httplib::Response& res) {
    const auto result = dispatcher.Prewarm();
    if (result.error) {
        ReplyError(res, *result.error);
        return;
    }
    Reply(res, 200, {{"status", result.status}});
}

void RegisterRoutes(httplib::Server& server,
                    executor::ExecutionDispatcher& dispatcher,
                    const session::SessionRegistry& registry,
                    const sandbox::WarmPool& pool) {
    server.Post("/execute", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        HandleExecute(dispatcher, req, res);
    });
    server.Post("/execute_pytest", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        HandleExecuteTests(dispatcher, req, res);
    });
    server.Get(R"(/result/([^/]+))", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        HandleResult(dispatcher, req.matches[1], res);
    });
    server.Post(R"(/cleanup/([^/]+))", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        HandleCleanup(dispatcher, req.matches[1], res);
    });
    server.Post("/prewarm", [&dispatcher](const httplib::Request&, httplib::Response& res) {
        HandlePrewarm(dispatcher, res);
    });
    server.Get("/health", [&registry, &pool](const httplib::Request&, httplib::Response& res) {
        Reply(res, 200, {
            {"status", "ok"},
            {"sessions", registry.Size()},
            {"pool_size", pool.Size()},
            {"pool_target", pool.TargetSize()}
        });
    });
    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            message = ex.what();
        }
        utils::Log(utils::LogLevel::kError, "http", req.method + " " + req.path + " failed: " + message);
        Reply(res, 500, {{"error", message}});
    });
}

}  // namespace runbox::server
