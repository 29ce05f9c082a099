#ifndef TESTUTIL_ASSERT
#define TESTUTIL_ASSERT

#include <exception>
#include <iostream>
#include <cstdlib>
#include <ctime>

//============================================================================
//                         Standard Test Macros
//============================================================================

unsigned int testutil_seed = 0;
static int ASSERT_COUNT = 0;
static void TESTUTIL_ASSERT_FUNCT(int c, const char *msg, const char *file, int line)
{
    if (c) {
        std::cout << "[" << testutil_seed << "] Error " << file
                  << "(" << line << "): " << msg
                  << "    (failed)" << std::endl;
        ++ASSERT_COUNT;
    }
}
#define ASSERT(X) { TESTUTIL_ASSERT_FUNCT(!(X), #X, __FILE__, __LINE__); }

// Check that 'STATEMENT' throws an exception of type 'TYPE'.  Any other exception is a failure too.
#define ASSERT_THROWS(STATEMENT, TYPE)                               \
{                                                                    \
    bool testutil_thrown = false;                                    \
    try {                                                            \
        STATEMENT;                                                   \
    } catch (TYPE &) {                                               \
        testutil_thrown = true;                                      \
    } catch (std::exception &e) {                                    \
        std::cout << "unexpected exception: " << e.what()            \
                  << std::endl;                                      \
    }                                                                \
    TESTUTIL_ASSERT_FUNCT(!testutil_thrown,                          \
                          #STATEMENT " throws " #TYPE,               \
                          __FILE__, __LINE__);                       \
}

// Check that 'STATEMENT' throws nothing.
#define ASSERT_NO_THROW(STATEMENT, TYPE)                             \
{                                                                    \
    bool testutil_thrown = false;                                    \
    try {                                                            \
        STATEMENT;                                                   \
    } catch (TYPE &) {                                               \
        testutil_thrown = true;                                      \
    }                                                                \
    TESTUTIL_ASSERT_FUNCT(testutil_thrown,                           \
                          #STATEMENT " does not throw " #TYPE,       \
                          __FILE__, __LINE__);                       \
}

#define TESTUTIL_INIT_RAND                                           \
{                                                                    \
    testutil_seed = static_cast<unsigned int>(std::time(0));         \
    std::srand(testutil_seed);                                       \
}

#endif // TESTUTIL_ASSERT
