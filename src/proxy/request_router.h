#pragma once
#include <QString>
#include <QList>
#include <optional>

struct Route {
    QString pathPattern;
    QString method;      // "POST", "GET" or "*" for any
    QString handler;
};

class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const Route& route);
    std::optional<Route> match(const QString& method, const QString& path) const;

    // True when some route serves the path, whatever its method.
    bool knowsPath(const QString& path) const;

    static QString stripQuery(const QString& path);

private:
    struct InternalRoute {
        QString method = QStringLiteral("POST");
        QString pathPrefix;  // URL path prefix for matching
        bool wildcard = false; // true if pathPattern ends with "*"
        Route route;
    };
    QList<InternalRoute> m_routes;

    bool pathMatches(const InternalRoute& entry, const QString& path) const;
};
