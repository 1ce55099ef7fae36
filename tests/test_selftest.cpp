#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>
#include <coincidence/selftest.hpp>

#include <sstream>
#include <string>

BOOST_AUTO_TEST_CASE(selftest_passes)
{
    std::ostringstream out;
    BOOST_CHECK_EQUAL(coincidence::SelfTest::run(out), 0u);

    std::string report = out.str();
    BOOST_CHECK(report.find("FAIL") == std::string::npos);
    BOOST_CHECK(report.find("10/10 passed") != std::string::npos);
}
