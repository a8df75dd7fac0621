#pragma once

#include "core/ranking/ranking_service.h"

#include <QJsonDocument>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace sr {

// RankerCli -- command-line front end over RankingService.
//
//   shoprank-cli [--config file] [--store file.db] <command> [args]
//
// Commands: rank <request.json>, record <events.json>, report [variant],
// validate, prune. Exit status 0 on success, 1 on any error.
class RankerCli {
public:
    RankerCli() = default;

    int run(const QStringList& arguments);

private:
    bool loadConfig(const QString& path);
    bool openService(const QString& storePath);

    int handleRank(const QStringList& args);
    int handleRecord(const QStringList& args);
    int handleReport(const QStringList& args);
    int handleValidate();
    int handlePrune();

    static std::optional<QJsonDocument> readJsonFile(const QString& path);
    static void writeJson(const QJsonDocument& doc);
    static void writeError(const QString& message);

    RankingConfig m_config = RankingConfig::defaults();
    std::unique_ptr<RankingService> m_service;
};

} // namespace sr
