// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_4710938275610394
#define SCOPE_GUARD_H_4710938275610394

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace ferry
{
/*  Scope Guard

        auto guardFd = ferry::makeGuard<ScopeGuardRunMode::onExit>([&] { ::close(fd); });
            ...
        guardFd.dismiss();

    Scope Exit:
        FERRY_ON_SCOPE_EXIT   (cleanUp());
        FERRY_ON_SCOPE_FAIL   (undoTemporaryWork());
        FERRY_ON_SCOPE_SUCCESS(notifySuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onSuccess)
        {
            if (!failed)
                fun_(); //throw X
        }
        else if constexpr (runMode == ScopeGuardRunMode::onFail)
        {
            if (failed)
                try { fun_(); }
                catch (...) { assert(false); } //must not throw while unwinding
        }
        else
        {
            if (!failed)
                fun_(); //throw X
            else
                try { fun_(); }
                catch (...) { assert(false); }
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define FERRY_CONCAT_SUB(X, Y) X ## Y
#define FERRY_CONCAT(X, Y) FERRY_CONCAT_SUB(X, Y)

#define FERRY_CHECK_CASE_FOR_CONSTANT(X) case X: return FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define FERRY_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onExit   >([&]{ X; });
#define FERRY_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onFail   >([&]{ X; });
#define FERRY_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_4710938275610394
