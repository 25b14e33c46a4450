#include "homework/data/DateFormat.hpp"

#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>

#include "homework/core/LruCache.hpp"

namespace homework {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "dd/MM/yyyy";
constexpr std::size_t PARSE_CACHE_CAPACITY = 1000;

class DateParseCache
{
public:
    QDate parse(const QString &text)
    {
        QMutexLocker locker(&m_mutex);
        if (auto cached = m_cache.find(text)) {
            return *cached;
        }
        const QDate date = parseUncached(text);
        m_cache.insert(text, date);
        return date;
    }

    void clear()
    {
        QMutexLocker locker(&m_mutex);
        m_cache.clear();
    }

private:
    static QDate parseUncached(const QString &text)
    {
        static const QRegularExpression pattern(
            QStringLiteral("^(\\d{1,2})\\s*[/-]\\s*(\\d{1,2})\\s*[/-]\\s*(\\d{1,4})$"));
        const QRegularExpressionMatch match = pattern.match(text);
        if (!match.hasMatch()) {
            return {};
        }
        const int day = match.captured(1).toInt();
        const int month = match.captured(2).toInt();
        int year = match.captured(3).toInt();
        if (year < 100) {
            year += 2000;
        }
        return QDate(year, month, day);
    }

    QMutex m_mutex;
    core::LruCache<QString, QDate> m_cache{PARSE_CACHE_CAPACITY};
};

DateParseCache &parseCache()
{
    static DateParseCache cache;
    return cache;
}
} // namespace

QDate parseDate(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    return parseCache().parse(trimmed);
}

QString formatDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DATE_FORMAT));
}

QString normalizeDate(const QString &text)
{
    const QDate date = parseDate(text);
    return date.isValid() ? formatDate(date) : text;
}

void clearDateCache()
{
    parseCache().clear();
}

} // namespace data
} // namespace homework
