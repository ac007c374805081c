#pragma once

// Invariant checks that must hold for the single-threaded design to be sound.
// A failed check is a programming error: it is logged and the process aborts.
#define NIO_PRECONDITION(cond, message)                                   \
    do {                                                                  \
        if (!(cond)) {                                                    \
            ::fatalError(#cond, (message), __FILE__, __LINE__);           \
        }                                                                 \
    } while (false)

[[noreturn]] void fatalError(const char* condition, const char* message, const char* file, int line);
