//
// Created by lewis on 4/12/24.
//

#define BOOST_TEST_MODULE BulkSubmitServerTests
#include <boost/test/unit_test.hpp>
