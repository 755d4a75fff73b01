/*
 * Include this file to use assert in test code. It ensures that
 * NDEBUG is undefined so that a release build can't make assertions
 * pass silently.
 */

#ifndef PDFSCRUB_ASSERT_TEST_H
#define PDFSCRUB_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* PDFSCRUB_ASSERT_TEST_H */
