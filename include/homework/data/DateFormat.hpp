#pragma once

#include <QDate>
#include <QString>

namespace homework {
namespace data {

// Accepts D/M/YYYY and DD/MM/YYYY with '/' or '-' separators, optionally surrounded by
// spaces. Years have one to four digits; years below 100 are taken as 20xx.
// Returns an invalid QDate for anything else. Thread-safe; results are memoized.
QDate parseDate(const QString &text);

QString formatDate(const QDate &date);

// Canonical dd/MM/yyyy form, or the input unchanged when it does not parse.
QString normalizeDate(const QString &text);

void clearDateCache();

} // namespace data
} // namespace homework
