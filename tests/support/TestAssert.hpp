#pragma once

#include "ecp/log/Log.hpp"

inline int& testFailures() {
    static int failures = 0;
    return failures;
}

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ecp::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++testFailures(); } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ecp::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++testFailures(); } } while(0)

inline int finishTests(const char* suite) {
    if (testFailures()) {
        ecp::logError(suite, ": ", testFailures(), " failure(s)\n");
        return 1;
    }
    ecp::logInfo(suite, " passed.\n");
    return 0;
}
