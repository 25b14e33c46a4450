#include "homework/core/StatusCache.hpp"

#include "homework/core/Logging.hpp"
#include "homework/data/HomeworkRepository.hpp"

namespace homework {
namespace core {

StatusCache::StatusCache(const data::HomeworkRepository &repository)
    : m_repository(repository)
{
}

void StatusCache::recomputeAll(const QDate &today, int remindDays)
{
    m_tags.clear();
    const auto items = m_repository.fetchAll();
    m_tags.reserve(static_cast<int>(items.size()));
    for (const auto &item : items) {
        m_tags.insert(item.code, classify(item, today, remindDays));
    }
    m_lastRecompute = today;
    qCDebug(lcTasks) << "Recomputed" << m_tags.size() << "status tags for" << today;
}

StatusTag StatusCache::get(const QString &code, const QDate &today, int remindDays)
{
    const auto it = m_tags.constFind(code);
    if (it != m_tags.constEnd()) {
        return it.value();
    }
    const auto item = m_repository.findByCode(code);
    if (!item) {
        return StatusTag::Pending;
    }
    const StatusTag tag = classify(*item, today, remindDays);
    m_tags.insert(code, tag);
    return tag;
}

void StatusCache::set(const QString &code, StatusTag tag)
{
    m_tags.insert(code, tag);
}

void StatusCache::invalidate(const QString &code)
{
    m_tags.remove(code);
}

void StatusCache::clear()
{
    m_tags.clear();
}

bool StatusCache::contains(const QString &code) const
{
    return m_tags.contains(code);
}

int StatusCache::size() const
{
    return m_tags.size();
}

QDate StatusCache::lastRecomputeDate() const
{
    return m_lastRecompute;
}

} // namespace core
} // namespace homework
