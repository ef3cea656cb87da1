#include "beo_wheel_debouncer.h"
#include "tests/test_support.h"

#include <utility>

using phicore::beo::RotationDirection;
using phicore::beo::RotationEvent;
using phicore::beo::WheelDebouncer;
using phicore::beo::monotonicMs;

namespace {

void record(WheelDebouncer &debouncer, QList<RotationEvent> *out)
{
    QObject::connect(&debouncer, &WheelDebouncer::rotation, [out](const RotationEvent &event) {
        out->append(event);
    });
}

qint64 now()
{
    return monotonicMs();
}

} // namespace

TEST_CASE("A burst of detents settles into one rotation", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(80);
    QList<RotationEvent> events;
    record(debouncer, &events);

    const qint64 t0 = now();
    REQUIRE_FALSE(debouncer.accumulate(QStringLiteral("wheel"), 1, t0).has_value());
    REQUIRE_FALSE(debouncer.accumulate(QStringLiteral("wheel"), 1, t0 + 10).has_value());
    REQUIRE_FALSE(debouncer.accumulate(QStringLiteral("wheel"), 2, t0 + 20).has_value());
    REQUIRE(debouncer.pendingCount(QStringLiteral("wheel")) == 4);
    REQUIRE(events.isEmpty());

    REQUIRE(beo_test::waitUntil([&]() { return !events.isEmpty(); }));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].controlId == QStringLiteral("wheel"));
    REQUIRE(events[0].direction == RotationDirection::Clockwise);
    REQUIRE(events[0].magnitude == 4);
    REQUIRE(debouncer.pendingCount(QStringLiteral("wheel")) == 0);
}

TEST_CASE("Counter-clockwise bursts report a negative signed magnitude", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(50);
    QList<RotationEvent> events;
    record(debouncer, &events);

    const qint64 t0 = now();
    debouncer.accumulate(QStringLiteral("wheel"), -2, t0);
    debouncer.accumulate(QStringLiteral("wheel"), -1, t0 + 5);

    REQUIRE(beo_test::waitUntil([&]() { return !events.isEmpty(); }));
    REQUIRE(events[0].direction == RotationDirection::CounterClockwise);
    REQUIRE(events[0].magnitude == 3);
    REQUIRE(events[0].signedMagnitude() == -3);
}

TEST_CASE("A burst with no net movement emits nothing", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(50);
    QList<RotationEvent> events;
    record(debouncer, &events);

    const qint64 t0 = now();
    debouncer.accumulate(QStringLiteral("wheel"), 2, t0);
    debouncer.accumulate(QStringLiteral("wheel"), -2, t0 + 5);

    beo_test::spinEventLoop(200);
    REQUIRE(events.isEmpty());
}

TEST_CASE("A detent after the quiet period settles the previous burst first", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(100);
    QList<RotationEvent> events;
    record(debouncer, &events);

    const qint64 t0 = now();
    debouncer.accumulate(QStringLiteral("wheel"), 3, t0);

    // The timer has not been delivered, but the timestamps show a gap.
    const auto settled = debouncer.accumulate(QStringLiteral("wheel"), -1, t0 + 150);
    REQUIRE(settled.has_value());
    REQUIRE(settled->signedMagnitude() == 3);
    REQUIRE(events.size() == 1);
    REQUIRE(debouncer.pendingCount(QStringLiteral("wheel")) == -1);

    REQUIRE(beo_test::waitUntil([&]() { return events.size() == 2; }));
    REQUIRE(events[1].signedMagnitude() == -1);
}

TEST_CASE("Wheels on different controls are debounced separately", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(60);
    QList<RotationEvent> events;
    record(debouncer, &events);

    const qint64 t0 = now();
    debouncer.accumulate(QStringLiteral("wheel"), 1, t0);
    debouncer.accumulate(QStringLiteral("volumeWheel"), -1, t0);

    REQUIRE(beo_test::waitUntil([&]() { return events.size() == 2; }));
    int net = 0;
    for (const RotationEvent &event : std::as_const(events))
        net += event.signedMagnitude();
    REQUIRE(net == 0);
}

TEST_CASE("Reset drops pending detents", "[wheel_debouncer]") {
    WheelDebouncer debouncer;
    debouncer.setQuietPeriodMs(50);
    QList<RotationEvent> events;
    record(debouncer, &events);

    debouncer.accumulate(QStringLiteral("wheel"), 5, now());
    debouncer.reset();
    REQUIRE(debouncer.pendingCount(QStringLiteral("wheel")) == 0);

    beo_test::spinEventLoop(200);
    REQUIRE(events.isEmpty());
}
