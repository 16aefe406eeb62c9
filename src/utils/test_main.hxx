/** \copyright
 * Copyright (c) 2026, Balazs Racz
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file test_main.hxx
 *
 * Unittest driver. Include this file from every test; it supplies the
 * application entry point and a log sink that tests can mute.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifdef _UTILS_TEST_MAIN_HXX_
#error Only ever include test_main into the main unittest file.
#else
#define _UTILS_TEST_MAIN_HXX_

#include <stdio.h>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "os/os.h"
#include "utils/logging.h"

int appl_main(int argc, char *argv[])
{
    testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}

bool mute_log_output = false;

extern "C" {

void log_output(char *buf, int size)
{
    if (size <= 0 || mute_log_output) return;
    fwrite(buf, size, 1, stderr);
    fwrite("\n", 1, 1, stderr);
}

}

/** Overrides the value of a variable and restores it to the original value
 * when destructed. Useful for changing flags for a single test only.
 *
 * Usage:
 * {
 *    ScopedOverride ov(&mute_log_output, true);
 *    ... test code assuming new value ...
 * }
 * ... now the original value is restored.
 */
class ScopedOverride
{
public:
    /// Constructor
    ///
    /// @param variable what to set temporarily
    /// @param new_value what should be the new value of variable during this
    /// code block.
    ///
    template <class T, typename U>
    ScopedOverride(T *variable, U new_value)
        : holder_(new Holder<T>(variable, new_value))
    {
    }

    /// Restores the original value.
    void restore()
    {
        holder_.reset();
    }

private:
    /// Virtual base class for the destructible holders.
    class HolderBase
    {
    public:
        virtual ~HolderBase()
        {
        }
    };

    /// Type-accurate class that holds the temporary variable with the old
    /// value, the pointer to the variable and restores the previous state upon
    /// destruction.
    template <class T> class Holder : public HolderBase
    {
    public:
        /// @param variable what to set temporarily
        /// @param new_value what should be the new value of variable during
        /// this code block.
        Holder(T *variable, T new_value)
            : variable_(variable)
            , oldValue_(*variable)
        {
            *variable = new_value;
        }

        ~Holder()
        {
            *variable_ = oldValue_;
        }

    private:
        /// Points to the variable that needs resetting.
        T *variable_;
        /// old value to reset variable_ to when destroyed.
        T oldValue_;
    };

    /// Smart ptr that will reset the variable to the previous value when going
    /// out of scope.
    std::unique_ptr<HolderBase> holder_;
};

#endif // _UTILS_TEST_MAIN_HXX_
