#include "test.hpp"

#include "error.hpp"
#include "shiftstore.hpp"
#include "tempfile.hpp"

namespace {
NewShift shift(std::string id, std::string date, std::string start = "8:00:00 am",
    std::string end = "5:00:00 pm")
{
    return NewShift { id, "Driver " + id, std::move(date), std::move(start),
        std::move(end) };
}
}

TEST_CASE("ShiftStore::append creates the file")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_CHECK(store.getPath() == file.path());
    const auto res = store.append({ "D1001", "Ahmed", "2025-05-15", "8:00:00 am", "5:00:00 pm" });
    TEST_REQUIRE(res.hasValue() && res->has_value());
    const auto& record = **res;
    TEST_CHECK(record.driverId == "D1001");
    TEST_CHECK(toString(record.shiftDuration) == "9:00:00");
    TEST_CHECK(toString(record.idleTime) == "0:00:00");
    TEST_CHECK(toString(record.activeTime) == "9:00:00");
    TEST_CHECK(record.metQuota);
    TEST_CHECK(!record.hasBonus);
    TEST_CHECK(file.read()
        == "D1001,Ahmed,2025-05-15,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false");
}

TEST_CASE("ShiftStore::append computes idle and quota")
{
    TempFile file;
    ShiftStore store(file.path());
    const auto res = store.append(shift("D1", "2025-04-12", "6:00:00 am", "1:00:00 pm"));
    TEST_REQUIRE(res.hasValue() && res->has_value());
    TEST_CHECK(toString((*res)->shiftDuration) == "7:00:00");
    TEST_CHECK(toString((*res)->idleTime) == "2:00:00");
    TEST_CHECK(toString((*res)->activeTime) == "5:00:00");
    TEST_CHECK(!(*res)->metQuota);
}

TEST_CASE("ShiftStore::append rejects duplicates")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-01")).hasValue());
    const auto before = file.read();

    const auto res = store.append(shift("D1", "2025-05-01", "9:00:00 am", "1:00:00 pm"));
    TEST_REQUIRE(res.hasValue());
    TEST_CHECK(!res->has_value());
    TEST_CHECK(file.read() == before);
    TEST_CHECK(store.readAll()->size() == 1);

    // Same date, other driver is fine
    const auto other = store.append(shift("D2", "2025-05-01"));
    TEST_CHECK(other.hasValue() && other->has_value());
    TEST_CHECK(store.readAll()->size() == 2);
}

TEST_CASE("ShiftStore keeps the file sorted by date")
{
    TempFile file;
    ShiftStore store(file.path());
    for (const auto date : { "2025-05-20", "2025-05-01", "2025-06-02", "2024-12-31", "2025-05-10" }) {
        TEST_REQUIRE(store.append(shift("D1", date)).hasValue());
    }
    const auto records = store.readAll();
    TEST_REQUIRE(records.hasValue() && records->size() == 5);
    for (size_t i = 1; i < records->size(); ++i) {
        TEST_CHECK((*records)[i - 1].date < (*records)[i].date);
    }
}

TEST_CASE("ShiftStore sorting is stable for equal dates")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-02")).hasValue());
    TEST_REQUIRE(store.append(shift("D2", "2025-05-02")).hasValue());
    TEST_REQUIRE(store.append(shift("D0", "2025-05-02")).hasValue());
    TEST_REQUIRE(store.append(shift("D9", "2025-05-01")).hasValue());
    const auto records = store.readAll();
    TEST_REQUIRE(records.hasValue() && records->size() == 4);
    TEST_CHECK((*records)[0].driverId == "D9");
    TEST_CHECK((*records)[1].driverId == "D1");
    TEST_CHECK((*records)[2].driverId == "D2");
    TEST_CHECK((*records)[3].driverId == "D0");
}

TEST_CASE("ShiftStore::append keeps existing lines verbatim")
{
    TempFile file("D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true\n"
                  "legacy line\n");
    ShiftStore store(file.path());
    TEST_REQUIRE(store.append(shift("D2", "2025-05-04")).hasValue());
    TEST_CHECK(file.read()
        == "legacy line\n"
           "D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true\n"
           "D2,Driver D2,2025-05-04,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false");
}

TEST_CASE("active time is shift duration minus idle time for appended records")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-01", "5:00:00 am", "11:30:00 pm")).hasValue());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-02", "9:00:00 pm", "3:00:00 am")).hasValue());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-03", "12:00:00 pm", "12:30:00 pm")).hasValue());
    const auto records = store.readAll();
    TEST_REQUIRE(records.hasValue() && records->size() == 3);
    for (const auto& record : *records) {
        TEST_CHECK(record.activeTime == record.shiftDuration - record.idleTime);
    }
}

TEST_CASE("ShiftStore::append rejects malformed shifts")
{
    TempFile file;
    ShiftStore store(file.path());
    const auto invalid = make_error_code(ShiftError::InvalidFormat);
    TEST_CHECK(store.append(shift("D1", "2025-5-1")).error() == invalid);
    TEST_CHECK(store.append(shift("D1", "2025-05-01", "25:00:00", "5:00:00 pm")).error() == invalid);
    TEST_CHECK(store.append({ "D1", "Doe, John", "2025-05-01", "8:00:00 am", "5:00:00 pm" }).error()
        == invalid);
    TEST_CHECK(store.append({ "", "Nobody", "2025-05-01", "8:00:00 am", "5:00:00 pm" }).error()
        == invalid);
    TEST_CHECK(!file.exists());
}

TEST_CASE("ShiftStore::setBonus")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-01")).hasValue());
    TEST_REQUIRE(store.append(shift("D2", "2025-05-01")).hasValue());

    const auto res = store.setBonus("D2", "2025-05-01", true);
    TEST_REQUIRE(res.hasValue());
    TEST_CHECK(*res);
    const auto records = store.readAll();
    TEST_REQUIRE(records.hasValue() && records->size() == 2);
    TEST_CHECK(!(*records)[0].hasBonus);
    TEST_CHECK((*records)[1].hasBonus);

    TEST_CHECK(*store.setBonus("D2", "2025-05-01", false));
    TEST_CHECK(!(*store.readAll())[1].hasBonus);
}

TEST_CASE("ShiftStore::setBonus leaves the file alone if nothing matches")
{
    const std::string contents
        = "D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false\r\n"
          "short,line\n\n";
    TempFile file(contents);
    ShiftStore store(file.path());
    const auto res = store.setBonus("D1", "2025-05-04", true);
    TEST_REQUIRE(res.hasValue());
    TEST_CHECK(!*res);
    TEST_CHECK(file.read() == contents);
}

TEST_CASE("ShiftStore::setBonus passes short lines through")
{
    TempFile file("short,line\n"
                  "D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false\n");
    ShiftStore store(file.path());
    TEST_CHECK(*store.setBonus("D1", "2025-05-03", true));
    TEST_CHECK(file.read()
        == "short,line\n"
           "D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true");
}

TEST_CASE("ShiftStore::setBonus on a missing file")
{
    TempFile file;
    ShiftStore store(file.path());
    const auto res = store.setBonus("D1", "2025-05-03", true);
    TEST_REQUIRE(res.hasValue());
    TEST_CHECK(!*res);
    TEST_CHECK(!file.exists());
}

TEST_CASE("readShiftRecords skips malformed lines")
{
    TempFile file("D1,A,2025-05-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false\n"
                  "too,short\n"
                  "D1,A,2025-13-03,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,false\n"
                  "D1,A,2025-05-04,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,maybe,false\n"
                  "D2,B,2025-05-04,8:00:00 am,5:00:00 pm,9:00:00,0:00:00,9:00:00,true,true\n");
    const auto records = readShiftRecords(file.path());
    TEST_REQUIRE(records.hasValue() && records->size() == 2);
    TEST_CHECK((*records)[0].driverId == "D1");
    TEST_CHECK((*records)[1].driverId == "D2");
    TEST_CHECK((*records)[1].hasBonus);

    TempFile missing;
    const auto none = readShiftRecords(missing.path());
    TEST_CHECK(none.hasValue() && none->empty());
}

TEST_CASE("ShiftStore::readAll returns the parsed records in file order")
{
    TempFile file;
    ShiftStore store(file.path());
    TEST_CHECK(store.readAll()->empty());

    TEST_REQUIRE(store.append(shift("D2", "2025-05-02", "9:00:00 pm", "11:00:00 pm")).hasValue());
    TEST_REQUIRE(store.append(shift("D1", "2025-05-01")).hasValue());
    TEST_REQUIRE(*store.setBonus("D2", "2025-05-02", true));

    const auto records = store.readAll();
    TEST_REQUIRE(records.hasValue() && records->size() == 2);
    const auto& first = (*records)[0];
    const auto& second = (*records)[1];
    TEST_CHECK(first.driverId == "D1");
    TEST_CHECK(first.driverName == "Driver D1");
    TEST_CHECK(toString(first.date) == "2025-05-01");
    TEST_CHECK(first.startTime == "8:00:00 am");
    TEST_CHECK(toString(first.activeTime) == "9:00:00");
    TEST_CHECK(first.metQuota);
    TEST_CHECK(!first.hasBonus);
    TEST_CHECK(second.driverId == "D2");
    TEST_CHECK(toString(second.idleTime) == "1:00:00");
    TEST_CHECK(toString(second.activeTime) == "1:00:00");
    TEST_CHECK(!second.metQuota);
    TEST_CHECK(second.hasBonus);
}
