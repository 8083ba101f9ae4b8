#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    // POST /v1/chat/completions -> translated chat completion
    addRoute({QStringLiteral("/v1/chat/completions"),
              QStringLiteral("POST"), QStringLiteral("chat.completions")});

    // /health answers any method
    addRoute({QStringLiteral("/health"),
              QStringLiteral("*"), QStringLiteral("health")});

    LOG_INFO(QStringLiteral("RequestRouter: registered %1 default routes")
                 .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    InternalRoute entry;
    entry.route = route;
    entry.method = route.method.isEmpty()
        ? QStringLiteral("POST") : route.method.trimmed().toUpper();

    // Handle wildcard paths: "/some/prefix/*"
    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

QString RequestRouter::stripQuery(const QString& path)
{
    const qsizetype q = path.indexOf(QLatin1Char('?'));
    return q < 0 ? path : path.left(q);
}

bool RequestRouter::pathMatches(const InternalRoute& entry, const QString& path) const
{
    // Wildcard routes use startsWith; exact routes require equality
    if (entry.wildcard)
        return path.startsWith(entry.pathPrefix);
    return path == entry.pathPrefix;
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    const QString bare = stripQuery(path);

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod) {
            continue;
        }
        if (pathMatches(entry, bare)) {
            return entry.route;
        }
    }

    return std::nullopt;
}

bool RequestRouter::knowsPath(const QString& path) const
{
    const QString bare = stripQuery(path);
    for (const InternalRoute& entry : m_routes) {
        if (pathMatches(entry, bare))
            return true;
    }
    return false;
}
