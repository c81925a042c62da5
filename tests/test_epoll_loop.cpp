#include <QtTest>
#include <memory>
#include <string>
#include <vector>
#include <cerrno>
#include <unistd.h>
#include <linux/input-event-codes.h>

#include "device_node.hpp"
#include "epoll_loop.hpp"
#include "fake_event_source.hpp"

using namespace evdevkit;

static DeviceState keypad()
{
    DeviceState state;
    state.set_name("fake keypad");
    AbsInfo abs;
    abs.minimum = -32768;
    abs.maximum = 32767;
    state.enable(EventCode{EV_ABS, ABS_X}, EnableData(abs));
    state.enable(EventCode{EV_ABS, ABS_Y}, EnableData(abs));
    state.enable(EventCode{EV_KEY, KEY_ENTER});
    return state;
}

// The node reads from the read end of a pipe so readiness can be
// triggered by hand. The fake source supplies the events.
class TestEpollLoop : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<EpollLoop> loop;
    std::unique_ptr<DeviceNode> node;
    FakeEventSource* source = nullptr;
    int write_end = -1;
    std::vector<std::string> seen;
    std::vector<DeviceNode*> disconnected;

    void make_ready()
    {
        const char byte = 1;
        QCOMPARE(static_cast<int>(write(write_end, &byte, 1)), 1);
    }

private slots:
    void init()
    {
        int fds[2];
        QCOMPARE(pipe(fds), 0);
        write_end = fds[1];

        node = std::make_unique<DeviceNode>();
        node->path = "/dev/input/event-test";
        node->resolved_path = node->path;
        node->fd = fds[0];
        auto fake = std::make_unique<FakeEventSource>(keypad(), fds[0]);
        source = fake.get();
        node->device = std::make_unique<Device>(std::move(fake));

        seen.clear();
        disconnected.clear();

        loop = std::make_unique<EpollLoop>();
        QVERIFY(loop->initialize());
        loop->set_event_callback([this](DeviceNode*, const InputEvent& ev) {
            seen.push_back(std::string(ev.code.name()) + "=" + std::to_string(ev.value.value_or(0)));
        });
        loop->set_drop_callback([this](DeviceNode*) {
            seen.push_back("dropped");
        });
        loop->set_disconnect_callback([this](DeviceNode* gone) {
            disconnected.push_back(gone);
        });
        QVERIFY(loop->add_device(node.get()));
    }

    void cleanup()
    {
        loop.reset();
        node.reset();
        source = nullptr;
        if (write_end >= 0) {
            close(write_end);
            write_end = -1;
        }
    }

    void testRejectsUnopenedNode()
    {
        DeviceNode closed;
        QVERIFY(!loop->add_device(&closed));
        QVERIFY(!loop->add_device(nullptr));

        // Adding a watched node again keeps a single entry
        QVERIFY(loop->add_device(node.get()));
        QCOMPARE(static_cast<int>(loop->device_count()), 1);
    }

    void testTimeoutDeliversNothing()
    {
        source->live_records.push_back(FakeEventSource::record(EV_ABS, ABS_X, 10));
        QCOMPARE(loop->run_once(0), 0);
        QVERIFY(seen.empty());
        QVERIFY(source->flags.empty());
    }

    void testEventsDeliveredInOrder()
    {
        source->live_records.push_back(FakeEventSource::record(EV_ABS, ABS_X, 10));
        source->live_records.push_back(FakeEventSource::record(EV_KEY, KEY_ENTER, 1));
        source->live_records.push_back(FakeEventSource::record(EV_SYN, SYN_REPORT, 0));
        make_ready();

        QCOMPARE(loop->run_once(100), 1);

        QCOMPARE(static_cast<int>(seen.size()), 3);
        QCOMPARE(seen[0], std::string("ABS_X=10"));
        QCOMPARE(seen[1], std::string("KEY_ENTER=1"));
        QCOMPARE(seen[2], std::string("SYN_REPORT=0"));
        QVERIFY(source->live_records.empty());
        QCOMPARE(*node->device->event_value(EventCode{EV_ABS, ABS_X}), 10);
    }

    void testDropIsFollowedBySyncReplay()
    {
        source->live_records.push_back(FakeEventSource::record(EV_ABS, ABS_X, 10));
        source->live_records.push_back(FakeEventSource::record(EV_SYN, SYN_DROPPED, 0));
        source->sync_records.push_back(FakeEventSource::record(EV_ABS, ABS_Y, 70));
        source->sync_records.push_back(FakeEventSource::record(EV_SYN, SYN_REPORT, 0));
        make_ready();

        QCOMPARE(loop->run_once(100), 1);

        QCOMPARE(static_cast<int>(seen.size()), 5);
        QCOMPARE(seen[0], std::string("ABS_X=10"));
        QCOMPARE(seen[1], std::string("SYN_DROPPED=0"));
        QCOMPARE(seen[2], std::string("dropped"));
        QCOMPARE(seen[3], std::string("ABS_Y=70"));
        QCOMPARE(seen[4], std::string("SYN_REPORT=0"));

        QVERIFY(source->sync_records.empty());
        QVERIFY(source->flags.back() == ReadFlag::Sync);
        QVERIFY(node->device->stream_state() == StreamState::Live);
    }

    void testDropWithoutResync()
    {
        loop->set_resync_on_drop(false);
        source->live_records.push_back(FakeEventSource::record(EV_SYN, SYN_DROPPED, 0));
        source->sync_records.push_back(FakeEventSource::record(EV_ABS, ABS_Y, 70));
        make_ready();

        QCOMPARE(loop->run_once(100), 1);

        QCOMPARE(static_cast<int>(seen.size()), 2);
        QCOMPARE(seen[1], std::string("dropped"));
        QCOMPARE(static_cast<int>(source->sync_records.size()), 1);
        for (auto flag : source->flags) {
            QVERIFY(flag == ReadFlag::Normal);
        }
        QVERIFY(node->device->stream_state() == StreamState::Resyncing);
        QCOMPARE(static_cast<int>(loop->device_count()), 1);
    }

    void testVanishedDeviceDisconnects()
    {
        source->live_records.push_back(FakeEventSource::record(EV_KEY, KEY_ENTER, 1));
        source->read_errno = ENODEV;
        make_ready();

        QCOMPARE(loop->run_once(100), 1);

        // Events read before the failure still arrive
        QCOMPARE(static_cast<int>(seen.size()), 1);
        QCOMPARE(seen[0], std::string("KEY_ENTER=1"));

        QCOMPARE(static_cast<int>(disconnected.size()), 1);
        QVERIFY(disconnected[0] == node.get());
        QVERIFY(!node->is_open());
        QCOMPARE(node->fd, -1);
        QCOMPARE(static_cast<int>(loop->device_count()), 0);
        source = nullptr;

        // Nothing is watched any more
        QCOMPARE(loop->run_once(0), 0);
    }

    void testOtherReadErrorKeepsNode()
    {
        source->read_errno = EIO;
        make_ready();

        QCOMPARE(loop->run_once(100), 1);

        QVERIFY(disconnected.empty());
        QVERIFY(node->is_open());
        QCOMPARE(static_cast<int>(loop->device_count()), 1);
    }

    void testHangupDisconnects()
    {
        source->live_records.push_back(FakeEventSource::record(EV_ABS, ABS_X, 10));
        close(write_end);
        write_end = -1;

        QCOMPARE(loop->run_once(100), 1);

        // A hangup is not read
        QVERIFY(seen.empty());
        QCOMPARE(static_cast<int>(disconnected.size()), 1);
        QVERIFY(!node->is_open());
        QCOMPARE(static_cast<int>(loop->device_count()), 0);
    }

    void testRemovedNodeIsNotRead()
    {
        source->live_records.push_back(FakeEventSource::record(EV_ABS, ABS_X, 10));
        QVERIFY(loop->remove_device(node.get()));
        QVERIFY(!loop->remove_device(node.get()));
        make_ready();

        QCOMPARE(loop->run_once(0), 0);
        QVERIFY(seen.empty());
        QVERIFY(node->is_open());
    }
};

QTEST_MAIN(TestEpollLoop)
#include "test_epoll_loop.moc"
