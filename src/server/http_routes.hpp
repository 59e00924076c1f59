#pragma once

#include <string>
#include <vector>

#include "executor/execution_dispatcher.hpp"
#include "httplib.h"
#include "sandbox/warm_pool.hpp"
#include "session/session_registry.hpp"

namespace runbox::server {

int StatusFor(ErrorKind kind);

std::vector<sandbox::SourceFile> UploadedFiles(const httplib::Request& req, const std::string& field);

void HandleExecute(executor::ExecutionDispatcher& dispatcher, const httplib::Request& req, httplib::Response& res);
void HandleExecuteTests(executor::ExecutionDispatcher& dispatcher, const httplib::Request& req, httplib::Response& res);
void HandleResult(executor::ExecutionDispatcher& dispatcher, const std::string& session_id, httplib::Response& res);
void HandleCleanup(executor::ExecutionDispatcher& dispatcher, const std::string& session_id, httplib::Response& res);
void HandlePrewarm(executor::ExecutionDispatcher& dispatcher, httplib::Response& res);

void RegisterRoutes(httplib::Server& server,
                    executor::ExecutionDispatcher& dispatcher,
                    const session::SessionRegistry& registry,
                    const sandbox::WarmPool& pool);

}  // namespace runbox::server
