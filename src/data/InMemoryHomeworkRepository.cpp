#include "homework/data/InMemoryHomeworkRepository.hpp"

#include "homework/core/Logging.hpp"

#include <algorithm>

namespace homework {
namespace data {

InMemoryHomeworkRepository::InMemoryHomeworkRepository() = default;
InMemoryHomeworkRepository::~InMemoryHomeworkRepository() = default;

std::vector<HomeworkItem> InMemoryHomeworkRepository::fetchAll() const
{
    return m_items;
}

std::optional<HomeworkItem> InMemoryHomeworkRepository::findByCode(const QString &code) const
{
    const auto it = m_index.constFind(code);
    if (it == m_index.constEnd()) {
        return std::nullopt;
    }
    return m_items.at(it.value());
}

bool InMemoryHomeworkRepository::contains(const QString &code) const
{
    return m_index.contains(code);
}

int InMemoryHomeworkRepository::count() const
{
    return static_cast<int>(m_items.size());
}

bool InMemoryHomeworkRepository::addHomework(HomeworkItem item)
{
    if (item.code.isEmpty() || m_index.contains(item.code)) {
        return false;
    }
    m_index.insert(item.code, m_items.size());
    m_items.push_back(std::move(item));
    return true;
}

bool InMemoryHomeworkRepository::updateHomework(const HomeworkItem &item)
{
    const auto it = m_index.constFind(item.code);
    if (it == m_index.constEnd()) {
        return false;
    }
    m_items[it.value()] = item;
    return true;
}

int InMemoryHomeworkRepository::removeHomeworks(const QSet<QString> &codes)
{
    const auto before = m_items.size();
    m_items.erase(std::remove_if(m_items.begin(), m_items.end(),
                                 [&codes](const HomeworkItem &item) {
                                     return codes.contains(item.code);
                                 }),
                  m_items.end());
    const auto removed = static_cast<int>(before - m_items.size());
    if (removed > 0) {
        rebuildIndex();
    }
    return removed;
}

void InMemoryHomeworkRepository::replaceAll(std::vector<HomeworkItem> items)
{
    m_items.clear();
    m_index.clear();
    m_items.reserve(items.size());
    for (auto &item : items) {
        const QString code = item.code;
        if (!addHomework(std::move(item))) {
            qCWarning(lcStorage) << "Dropping record with empty or repeated code" << code;
        }
    }
}

void InMemoryHomeworkRepository::clear()
{
    m_items.clear();
    m_index.clear();
}

void InMemoryHomeworkRepository::rebuildIndex()
{
    m_index.clear();
    for (std::size_t i = 0; i < m_items.size(); ++i) {
        m_index.insert(m_items[i].code, i);
    }
}

} // namespace data
} // namespace homework
