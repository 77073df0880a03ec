#pragma once

#include <QList>
#include <QPair>
#include <QString>

// Short explanations of concepts a candidate may ask about.
class ConceptLookup {
public:
    virtual ~ConceptLookup() = default;
    virtual QString lookup(const QString &query) const = 0;
};

// Answers from a fixed knowledge base. The first entry whose key occurs in
// the lower-cased query wins, so more specific keys are listed first.
class StaticConceptLookup : public ConceptLookup {
public:
    using Entry = QPair<QString, QString>;

    StaticConceptLookup();
    explicit StaticConceptLookup(const QList<Entry> &entries);

    QString lookup(const QString &query) const override;

    static const QList<Entry> &defaultEntries();
    static QString fallbackAnswer();

private:
    QList<Entry> entries_;
};
