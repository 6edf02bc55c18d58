// Tests for the Sentinel trait and its Option<T> implementation
#include "takemut/sentinel.hpp"
#include <cassert>
#include <cstdio>
#include <memory>
#include <string>

using namespace takemut;

struct WithMembers {
    int state;
    static WithMembers new_sentinel() { return WithMembers{0}; }
};

struct WrongReturnType {
    static int new_sentinel() { return 0; }
};

struct Plain {
    int state;
};

struct Specialized {
    bool valid;
};

TAKEMUT_SENTINEL(Specialized, Specialized{false})

// ============================================================================
// Detection
// ============================================================================

static_assert(is_sentinel_v<Option<int>>, "Option<int> should be a Sentinel type");
static_assert(is_sentinel_v<Option<std::string>>, "Option<std::string> should be a Sentinel type");
static_assert(is_sentinel_v<Option<std::unique_ptr<int>>>,
              "Option of a move-only type should be a Sentinel type");
static_assert(is_sentinel_v<WithMembers>, "static T::new_sentinel() should opt in");
static_assert(is_sentinel_v<Specialized>, "TAKEMUT_SENTINEL should opt in");

static_assert(!is_sentinel_v<int>, "int has no sentinel");
static_assert(!is_sentinel_v<std::string>, "std::string has no sentinel");
static_assert(!is_sentinel_v<Plain>, "a plain struct has no sentinel");
static_assert(!is_sentinel_v<WrongReturnType>,
              "new_sentinel() must return the type itself");

// ============================================================================
// Option<T>
// ============================================================================

void test_option_new_sentinel_is_none() {
    printf("test_option_new_sentinel_is_none: ");
    {
        Option<int> a = Sentinel<Option<int>>::new_sentinel();
        Option<std::string> b = Sentinel<Option<std::string>>::new_sentinel();
        assert(a.is_none());
        assert(b.is_none());
        assert(a == Option<int>(None));
        assert(Sentinel<Option<int>>::new_sentinel() == Sentinel<Option<int>>::new_sentinel());
    }
    printf("PASS\n");
}

void test_option_release_sentinel() {
    printf("test_option_release_sentinel: ");
    {
        Option<std::unique_ptr<int>> sentinel =
            Sentinel<Option<std::unique_ptr<int>>>::new_sentinel();
        // @unsafe { sentinel came straight from new_sentinel() }
        Sentinel<Option<std::unique_ptr<int>>>::release_sentinel(std::move(sentinel));
        assert(sentinel.is_none());
    }
    printf("PASS\n");
}

// ============================================================================
// User types
// ============================================================================

void test_member_sentinel() {
    printf("test_member_sentinel: ");
    {
        WithMembers s = Sentinel<WithMembers>::new_sentinel();
        assert(s.state == 0);
        // No release_sentinel() member: the default just drops it
        Sentinel<WithMembers>::release_sentinel(std::move(s));
    }
    printf("PASS\n");
}

void test_specialized_sentinel() {
    printf("test_specialized_sentinel: ");
    {
        Specialized s = Sentinel<Specialized>::new_sentinel();
        assert(!s.valid);
        Sentinel<Specialized>::release_sentinel(std::move(s));
    }
    printf("PASS\n");
}

int main() {
    printf("=== Sentinel Tests ===\n");

    test_option_new_sentinel_is_none();
    test_option_release_sentinel();
    test_member_sentinel();
    test_specialized_sentinel();

    printf("\nAll Sentinel tests passed!\n");
    return 0;
}
