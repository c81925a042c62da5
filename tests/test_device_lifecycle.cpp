#include <QtTest>
#include <memory>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input-event-codes.h>

#include "device.hpp"
#include "errors.hpp"
#include "fake_event_source.hpp"

using namespace evdevkit;

static DeviceState joystick()
{
    DeviceState state;
    state.set_name("fake joystick");
    AbsInfo abs;
    abs.minimum = 0;
    abs.maximum = 255;
    abs.flat = 15;
    state.enable(EventCode{EV_ABS, ABS_X}, EnableData(abs));
    state.enable(EventCode{EV_KEY, BTN_TRIGGER});
    return state;
}

class TestDeviceLifecycle : public QObject {
    Q_OBJECT

private:
    FakeEventSource* source = nullptr;

    std::unique_ptr<Device> make_device()
    {
        auto fake = std::make_unique<FakeEventSource>(joystick(), 5);
        source = fake.get();
        return std::make_unique<Device>(std::move(fake));
    }

private slots:
    void testAttachLoadsStateAndClock()
    {
        auto device = make_device();
        QCOMPARE(source->load_count, 1);
        QCOMPARE(static_cast<int>(source->clocks.size()), 1);
        QCOMPARE(static_cast<int>(source->clocks[0]), static_cast<int>(CLOCK_MONOTONIC));
        QCOMPARE(QString::fromStdString(device->name()), QStringLiteral("fake joystick"));
        QCOMPARE(device->fd(), 5);
        QVERIFY(device->has_event(EventCode{EV_KEY, BTN_TRIGGER}));
    }

    void testNullSourceIsRejected()
    {
        QVERIFY_EXCEPTION_THROWN(std::make_unique<Device>(std::unique_ptr<EventSource>()), InvalidFileError);
    }

    void testNonEvdevDescriptorIsRejected()
    {
        QVERIFY_EXCEPTION_THROWN(std::make_unique<Device>(-1), InvalidFileError);

        int fd = open("/dev/null", O_RDONLY | O_NONBLOCK);
        QVERIFY(fd >= 0);
        QVERIFY_EXCEPTION_THROWN(std::make_unique<Device>(fd), InvalidFileError);
        close(fd);
    }

    void testGrabAndUngrab()
    {
        auto device = make_device();
        device->grab();
        QVERIFY(device->is_grabbed());

        device->ungrab();
        QVERIFY(!device->is_grabbed());
        QCOMPARE(static_cast<int>(source->grab_calls.size()), 2);
        QVERIFY(source->grab_calls[0]);
        QVERIFY(!source->grab_calls[1]);
    }

    void testRefusedGrab()
    {
        auto device = make_device();
        source->grab_result = -EBUSY;
        QVERIFY_EXCEPTION_THROWN(device->grab(), DeviceGrabError);
        QVERIFY(!device->is_grabbed());
    }

    void testManualDeviceCannotGrab()
    {
        Device manual;
        QVERIFY_EXCEPTION_THROWN(manual.grab(), DeviceGrabError);
        QVERIFY(!manual.is_grabbed());

        manual.ungrab();
        QVERIFY(!manual.is_grabbed());
    }

    void testManualDeviceRejectsFd()
    {
        Device manual;
        QCOMPARE(manual.fd(), -1);
        QVERIFY_EXCEPTION_THROWN(manual.set_fd(3), InvalidFileError);
    }

    void testSetFdRebinds()
    {
        auto device = make_device();
        device->set_fd(9);
        QCOMPARE(device->fd(), 9);
        QCOMPARE(static_cast<int>(source->fd_changes.size()), 1);
        QCOMPARE(static_cast<int>(source->clocks.size()), 2);

        // Not grabbed, so no grab is issued
        QVERIFY(source->grab_calls.empty());
    }

    void testSetFdReissuesGrab()
    {
        auto device = make_device();
        device->grab();
        device->set_fd(9);
        QCOMPARE(static_cast<int>(source->grab_calls.size()), 2);
        QVERIFY(source->grab_calls[1]);
        QVERIFY(device->is_grabbed());
    }

    void testFailedRegrabIsSilent()
    {
        auto device = make_device();
        device->grab();

        // The old descriptor still holds the grab
        source->grab_result = -EBUSY;
        device->set_fd(9);
        QCOMPARE(device->fd(), 9);
        QCOMPARE(static_cast<int>(source->grab_calls.size()), 2);
    }

    void testAbsinfoReadAndMerge()
    {
        auto device = make_device();
        EventCode abs_x{EV_ABS, ABS_X};

        auto current = device->absinfo(abs_x);
        QVERIFY(current);
        QCOMPARE(*current->flat, 15);

        AbsInfo update;
        update.fuzz = 2;
        auto merged = device->absinfo(abs_x, update);
        QVERIFY(merged);
        QCOMPARE(*merged->maximum, 255);
        QCOMPARE(*merged->fuzz, 2);
        QVERIFY(source->kernel_abs.empty());
        QCOMPARE(static_cast<int>(source->local_abs.size()), 1);
        QCOMPARE(source->local_abs[0].second.fuzz, 2);

        EventCode abs_y{EV_ABS, ABS_Y};
        QVERIFY(!device->absinfo(abs_y));
        QVERIFY(!device->absinfo(abs_y, update));
    }

    void testKernelAbsinfoCommit()
    {
        auto device = make_device();
        EventCode abs_x{EV_ABS, ABS_X};

        QVERIFY_EXCEPTION_THROWN(device->absinfo(abs_x, std::nullopt, true), InvalidArgumentError);
        QVERIFY(source->kernel_abs.empty());

        AbsInfo update;
        update.maximum = 1023;
        auto merged = device->absinfo(abs_x, update, true);
        QVERIFY(merged);
        QCOMPARE(static_cast<int>(source->kernel_abs.size()), 1);
        QCOMPARE(source->kernel_abs[0].second.maximum, 1023);
        QCOMPARE(source->kernel_abs[0].second.flat, 15);
        QCOMPARE(*device->absinfo(abs_x)->maximum, 1023);
    }

    void testKernelCommitNeedsDescriptor()
    {
        Device manual;
        AbsInfo abs;
        abs.maximum = 10;
        manual.enable(EventCode{EV_ABS, ABS_X}, EnableData(abs));

        AbsInfo update;
        update.maximum = 20;
        QVERIFY_EXCEPTION_THROWN(manual.absinfo(EventCode{EV_ABS, ABS_X}, update, true), InvalidFileError);
        QCOMPARE(*manual.absinfo(EventCode{EV_ABS, ABS_X})->maximum, 10);
    }

    void testValueWritesReachSource()
    {
        auto device = make_device();
        EventCode trigger{EV_KEY, BTN_TRIGGER};
        QCOMPARE(*device->event_value(trigger, 1), 1);
        QCOMPARE(static_cast<int>(source->value_writes.size()), 1);

        // Unsupported codes are not forwarded
        QVERIFY(!device->event_value(EventCode{EV_KEY, BTN_THUMB}, 1));
        QCOMPARE(static_cast<int>(source->value_writes.size()), 1);
    }

    void testManualIdentitySetters()
    {
        Device manual;
        manual.set_name("manual");
        manual.set_uniq(std::string("serial-1"));
        IdUpdate id;
        id.vendor = 0xabcd;
        manual.set_id(id);

        QCOMPARE(QString::fromStdString(manual.name()), QStringLiteral("manual"));
        QCOMPARE(QString::fromStdString(*manual.uniq()), QStringLiteral("serial-1"));
        QVERIFY(!manual.phys());
        QCOMPARE(static_cast<int>(manual.id().vendor), 0xabcd);
        QCOMPARE(static_cast<int>(manual.id().bustype), 0);
    }
};

QTEST_MAIN(TestDeviceLifecycle)
#include "test_device_lifecycle.moc"
