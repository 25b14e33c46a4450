#pragma once

#include <QSet>
#include <optional>
#include <vector>

#include "homework/data/Homework.hpp"

namespace homework {
namespace data {

class HomeworkRepository
{
public:
    virtual ~HomeworkRepository() = default;

    virtual std::vector<HomeworkItem> fetchAll() const = 0;
    virtual std::optional<HomeworkItem> findByCode(const QString &code) const = 0;
    virtual bool contains(const QString &code) const = 0;
    virtual int count() const = 0;

    // Returns false and leaves the collection untouched when the code is taken.
    virtual bool addHomework(HomeworkItem item) = 0;
    virtual bool updateHomework(const HomeworkItem &item) = 0;
    virtual int removeHomeworks(const QSet<QString> &codes) = 0;
    virtual void replaceAll(std::vector<HomeworkItem> items) = 0;
    virtual void clear() = 0;
};

} // namespace data
} // namespace homework
