#include <QtTest>
#include <algorithm>
#include <linux/input-event-codes.h>
#include <libevdev-1.0/libevdev/libevdev.h>

#include "event_codes.hpp"

using namespace evdevkit;

static QString str(std::string_view s)
{
    return QString::fromUtf8(s.data(), static_cast<int>(s.size()));
}

class TestEventCodes : public QObject {
    Q_OBJECT

private slots:
    void testTypeNamesAndMax()
    {
        EventType abs{EV_ABS};
        QVERIFY(abs.is_valid());
        QCOMPARE(str(abs.name()), QStringLiteral("EV_ABS"));
        QCOMPARE(abs.max(), ABS_MAX);
        QCOMPARE(static_cast<int>(abs.codes().size()), ABS_MAX + 1);
    }

    void testCodeNames()
    {
        EventCode key_a{EV_KEY, KEY_A};
        QVERIFY(key_a.is_valid());
        QCOMPARE(str(key_a.name()), QStringLiteral("KEY_A"));
        QVERIFY(key_a.event_type() == EventType{EV_KEY});

        EventCode report{EV_SYN, SYN_REPORT};
        QCOMPARE(str(report.name()), QStringLiteral("SYN_REPORT"));
    }

    void testUnknownValuesAreInvalid()
    {
        QVERIFY(!registry::evbit(EV_CNT));
        QVERIFY(!registry::evbit(EV_REL, REL_MAX + 1));
        QVERIFY(!registry::propbit(INPUT_PROP_CNT));

        EventCode past_end{EV_REL, REL_MAX + 1};
        QVERIFY(!past_end.is_valid());
        QVERIFY(past_end.name().empty());
    }

    void testReservedCodesGetGeneratedNames()
    {
        // 0x0b..0x0f are a gap between ABS_BRAKE and ABS_HAT0X
        EventCode gap{EV_ABS, 0x0b};
        QVERIFY(gap.is_valid());
        QVERIFY(!gap.name().empty());
        if (!libevdev_event_code_get_name(EV_ABS, 0x0b)) {
            QCOMPARE(str(gap.name()), QStringLiteral("ABS_0x0B"));
            auto back = registry::code_from_name("ABS_0x0B");
            QVERIFY(back);
            QVERIFY(*back == gap);
        }
    }

    void testLookupByName()
    {
        auto rel = registry::type_from_name("EV_REL");
        QVERIFY(rel);
        QCOMPARE(static_cast<int>(rel->value), EV_REL);

        auto rel_x = registry::code_from_name("REL_X");
        QVERIFY(rel_x);
        QCOMPARE(static_cast<int>(rel_x->type), EV_REL);
        QCOMPARE(static_cast<int>(rel_x->value), REL_X);

        // Type and code lookups do not cross over
        QVERIFY(!registry::type_from_name("REL_X"));
        QVERIFY(!registry::code_from_name("EV_REL"));

        QVERIFY(!registry::bit_from_name("NOT_A_CODE"));
    }

    void testAliasesResolve()
    {
        auto mouse = registry::code_from_name("BTN_MOUSE");
        QVERIFY(mouse);
        EventCode left{EV_KEY, BTN_LEFT};
        QVERIFY(*mouse == left);
    }

    void testBitFromNameKeepsVariantKind()
    {
        auto type_bit = registry::bit_from_name("EV_KEY");
        QVERIFY(type_bit);
        QVERIFY(std::holds_alternative<EventType>(*type_bit));

        auto code_bit = registry::bit_from_name("KEY_ESC");
        QVERIFY(code_bit);
        QVERIFY(std::holds_alternative<EventCode>(*code_bit));
        QCOMPARE(str(name_of(*code_bit)), QStringLiteral("KEY_ESC"));
        QCOMPARE(static_cast<int>(type_of(*code_bit).value), EV_KEY);
    }

    void testProperties()
    {
        auto direct = registry::propbit(INPUT_PROP_DIRECT);
        QVERIFY(direct);
        QCOMPARE(str(direct->name()), QStringLiteral("INPUT_PROP_DIRECT"));

        auto by_name = registry::property_from_name("INPUT_PROP_POINTER");
        QVERIFY(by_name);
        QCOMPARE(static_cast<int>(by_name->value), INPUT_PROP_POINTER);
        QVERIFY(!registry::property_from_name("INPUT_PROP_NOPE"));
    }

    void testRegistryListsAreOrdered()
    {
        const auto& types = registry::event_types();
        QVERIFY(!types.empty());
        QCOMPARE(static_cast<int>(types.front().value), EV_SYN);
        for (size_t i = 1; i < types.size(); i++) {
            QVERIFY(types[i - 1] < types[i]);
        }

        EventCode a{EV_KEY, KEY_A};
        EventCode b{EV_KEY, KEY_B};
        EventCode x{EV_ABS, ABS_X};
        QVERIFY(a < b);
        QVERIFY(a < x);
        QVERIFY(!(x < a));
    }

    void testSynCodesIncludeDropped()
    {
        auto codes = EventType{EV_SYN}.codes();
        EventCode dropped{EV_SYN, SYN_DROPPED};
        QVERIFY(std::find(codes.begin(), codes.end(), dropped) != codes.end());
    }
};

QTEST_MAIN(TestEventCodes)
#include "test_event_codes.moc"
