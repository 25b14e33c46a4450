#include <QtTest/QtTest>

#include <QThread>
#include <atomic>
#include <memory>

#include "homework/core/BoundedChannel.hpp"

using homework::core::BoundedChannel;

class BoundedChannelTest : public QObject
{
    Q_OBJECT

private slots:
    void preservesOrderAcrossThreads();
    void fullChannelBlocksProducer();
};

void BoundedChannelTest::preservesOrderAcrossThreads()
{
    BoundedChannel<int> channel(4);
    constexpr int count = 500;
    std::unique_ptr<QThread> producer(QThread::create([&channel]() {
        for (int i = 0; i < count; ++i) {
            channel.push(i);
        }
    }));
    producer->start();

    for (int expected = 0; expected < count; ++expected) {
        QVERIFY(channel.size() <= channel.capacity());
        QCOMPARE(channel.pop(), expected);
    }
    QVERIFY(producer->wait(5000));
    QCOMPARE(channel.size(), static_cast<std::size_t>(0));
}

void BoundedChannelTest::fullChannelBlocksProducer()
{
    BoundedChannel<int> channel(2);
    channel.push(1);
    channel.push(2);

    std::atomic<bool> pushed{ false };
    std::unique_ptr<QThread> producer(QThread::create([&channel, &pushed]() {
        channel.push(3);
        pushed = true;
    }));
    producer->start();

    QTest::qWait(100);
    QVERIFY(!pushed.load());
    QCOMPARE(channel.pop(), 1);
    QVERIFY(producer->wait(5000));
    QVERIFY(pushed.load());
    QCOMPARE(channel.pop(), 2);
    QCOMPARE(channel.pop(), 3);
}

QTEST_GUILESS_MAIN(BoundedChannelTest)
#include "BoundedChannelTest.moc"
