#include <vkbind/result.hpp>

#include <cassert>
#ifndef VKBIND_ENABLE_EXCEPTIONS
#define VKBIND_ENABLE_EXCEPTIONS 1
#endif
#if VKBIND_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <string>

int main() {
    // Ok result
    {
        vkbind::Result<int> r = 42;
        assert(r.ok());
        assert(r);
        assert(r.value() == 42);
    }

    // Error result
    {
        vkbind::Result<int> r = vkbind::Error{"create instance", -1, "out of memory"};
        assert(!r.ok());
        assert(!r);
        assert(r.error().operation == "create instance");
        assert(r.error().vkResult == -1);
    }

    // String value
    {
        vkbind::Result<std::string> r = std::string("hello");
        assert(r.ok());
        assert(r.value() == "hello");
    }

    // Returned from function
    {
        auto make = [](bool succeed) -> vkbind::Result<int> {
            if (succeed)
                return 7;
            return vkbind::Error{"test op", 0, "nope"};
        };

        auto good = make(true);
        auto bad = make(false);
        assert(good.ok() && good.value() == 7);
        assert(!bad.ok() && bad.error().message == "nope");
    }

    // Result<void> success
    {
        vkbind::Result<void> r;
        assert(r.ok());
        assert(r);
    }

    // Result<void> error
    {
        vkbind::Result<void> r = vkbind::Error{"compile", -3, "failed"};
        assert(!r.ok());
        assert(!r);
        assert(r.error().operation == "compile");
        assert(r.error().vkResult == -3);
        assert(r.error().message == "failed");
    }

    // failedWith matches the kind only on error
    {
        vkbind::Result<int> bad = vkbind::Error{"allocate descriptor set", 0, "pool is full",
                                                vkbind::ErrorKind::OutOfMemory};
        assert(bad.failedWith(vkbind::ErrorKind::OutOfMemory));
        assert(!bad.failedWith(vkbind::ErrorKind::LayoutMismatch));

        vkbind::Result<int> good = 1;
        assert(!good.failedWith(vkbind::ErrorKind::OutOfMemory));

        vkbind::Result<void> mismatch = vkbind::Error{"decode descriptor write", 0, "binding 3",
                                                      vkbind::ErrorKind::LayoutMismatch};
        assert(mismatch.failedWith(vkbind::ErrorKind::LayoutMismatch));
        assert(!vkbind::Result<void>{}.failedWith(vkbind::ErrorKind::LayoutMismatch));
    }

    // Moving the value out
    {
        vkbind::Result<std::string> r = std::string("layout");
        std::string s = std::move(r).value();
        assert(s == "layout");
    }

    // Result<void> returned from function
    {
        auto attempt = [](bool succeed) -> vkbind::Result<void> {
            if (succeed)
                return {};
            return vkbind::Error{"op", 0, "nope"};
        };

        assert(attempt(true).ok());
        assert(!attempt(false).ok());
    }

    // orThrow on success
    {
        auto make = []() -> vkbind::Result<int> { return 99; };
        int val = make().orThrow();
        assert(val == 99);
    }

#if VKBIND_ENABLE_EXCEPTIONS
    // orThrow on error (exceptions-enabled builds only).
    {
        auto make = []() -> vkbind::Result<int> { return vkbind::Error{"test", -1, "boom"}; };
        bool caught = false;
        try {
            make().orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("test") != std::string::npos);
            assert(msg.find("boom") != std::string::npos);
        }
        assert(caught);
    }
#endif

    // orThrow on Result<void> success
    {
        vkbind::Result<void> r;
        std::move(r).orThrow();
    }

#if VKBIND_ENABLE_EXCEPTIONS
    // orThrow on Result<void> error (exceptions-enabled builds only).
    {
        vkbind::Result<void> r = vkbind::Error{"compile", -3, "failed"};
        bool caught = false;
        try {
            std::move(r).orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("compile") != std::string::npos);
        }
        assert(caught);
    }
#endif

    return 0;
}
