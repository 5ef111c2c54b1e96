#define BOOST_TEST_MODULE rwa_lending
#include <boost/test/unit_test.hpp>
