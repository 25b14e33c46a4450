#pragma once

#include <QHash>

#include "homework/data/HomeworkRepository.hpp"

namespace homework {
namespace data {

class InMemoryHomeworkRepository : public HomeworkRepository
{
public:
    InMemoryHomeworkRepository();
    ~InMemoryHomeworkRepository() override;

    std::vector<HomeworkItem> fetchAll() const override;
    std::optional<HomeworkItem> findByCode(const QString &code) const override;
    bool contains(const QString &code) const override;
    int count() const override;

    bool addHomework(HomeworkItem item) override;
    bool updateHomework(const HomeworkItem &item) override;
    int removeHomeworks(const QSet<QString> &codes) override;
    void replaceAll(std::vector<HomeworkItem> items) override;
    void clear() override;

private:
    void rebuildIndex();

    std::vector<HomeworkItem> m_items;
    QHash<QString, std::size_t> m_index;
};

} // namespace data
} // namespace homework
