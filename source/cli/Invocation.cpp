#include "Invocation.hpp"

#include <memory>
#include <optional>

#include "CommandRunner.hpp"
#include "ErrorHandler.hpp"
#include "JsonFileStorage.hpp"
#include "Logger.hpp"
#include "StoreLock.hpp"
#include "TaskServiceImpl.hpp"

int runInvocation(const AppConfig &config, const CommandRequest &request,
                  QTextStream &out, QTextStream &err) {
    // ──────────────────────────────
    // 1. Блокировка на цикл load → mutate → save
    // ──────────────────────────────
    std::optional<StoreLock> lock;
    if (isMutating(request.kind)) {
        lock.emplace(config.storePath);
        const Status locked = lock->acquire(config.lockTimeoutMs);
        if (!locked) {
            return reportCliError(err, locked.error());
        }
    } else {
        qDebug(appCli) << "Read-only command, store lock skipped";
    }

    // ──────────────────────────────
    // 2. Хранилище и сервис
    // ──────────────────────────────
    auto storage = std::make_shared<JsonFileStorage>(config.storePath);
    auto service = std::make_shared<TaskServiceImpl>(storage);

    const Status loaded = service->load();
    if (!loaded) {
        return reportCliError(err, loaded.error());
    }

    // ──────────────────────────────
    // 3. Команда
    // ──────────────────────────────
    CommandRunner runner(service, config.jsonOutput ? OutputFormat::Json
                                                    : OutputFormat::Text);
    const Status done = runner.execute(request, out);
    if (!done) {
        return reportCliError(err, done.error());
    }

    return ExitSuccess;
}
