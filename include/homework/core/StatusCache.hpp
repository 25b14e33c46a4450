#pragma once

#include <QDate>
#include <QHash>
#include <QString>

#include "homework/core/StatusClassifier.hpp"

namespace homework {
namespace data {
class HomeworkRepository;
}

namespace core {

// Memoized status tags for the items of one repository. A miss is never an
// error: the tag is computed from the matching item and remembered.
class StatusCache
{
public:
    explicit StatusCache(const data::HomeworkRepository &repository);

    void recomputeAll(const QDate &today, int remindDays);
    StatusTag get(const QString &code, const QDate &today, int remindDays);
    void set(const QString &code, StatusTag tag);
    void invalidate(const QString &code);
    void clear();

    bool contains(const QString &code) const;
    int size() const;
    // Day of the last full recompute; invalid until the first one.
    QDate lastRecomputeDate() const;

private:
    const data::HomeworkRepository &m_repository;
    QHash<QString, StatusTag> m_tags;
    QDate m_lastRecompute;
};

} // namespace core
} // namespace homework
