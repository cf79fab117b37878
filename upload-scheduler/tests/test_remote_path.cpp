/**
 * @file test_remote_path.cpp
 * @brief Remote path normalisation and composition
 */

// Standard Library Includes
#include <cassert>
#include <iostream>

// Project Includes
#include <automation/upload_scheduler/RemotePath.hpp>

using namespace automation::upload_scheduler;

static void test_backslashes_and_trailing_root_slash()
{
    assert(
        compose_remote_path("/dayzstandalone/", "\\configs\\loot.xml")
        == "/dayzstandalone/configs/loot.xml"
    );
}

static void test_root_without_leading_slash()
{
    assert(
        compose_remote_path("dayzstandalone", "configs/types.xml")
        == "/dayzstandalone/configs/types.xml"
    );
}

static void test_duplicate_separators_collapse()
{
    assert(
        compose_remote_path("//srv///mission//", "//db\\\\events.xml")
        == "/srv/mission/db/events.xml"
    );
}

static void test_empty_root()
{
    assert(compose_remote_path("", "serverDZ.cfg") == "/serverDZ.cfg");
    assert(compose_remote_path("/", "/serverDZ.cfg") == "/serverDZ.cfg");
}

static void test_empty_remote_path_is_the_root()
{
    assert(compose_remote_path("/dayzstandalone/", "") == "/dayzstandalone");
    assert(compose_remote_path("", "") == "/");
}

static void test_normalize_remote()
{
    assert(normalize_remote("\\\\a\\b") == "a/b");
    assert(normalize_remote("///") == "");
    assert(normalize_remote("plain.txt") == "plain.txt");
}

int main()
{
    test_backslashes_and_trailing_root_slash();
    test_root_without_leading_slash();
    test_duplicate_separators_collapse();
    test_empty_root();
    test_empty_remote_path_is_the_root();
    test_normalize_remote();

    std::cout << "All remote path tests passed!" << std::endl;
    return 0;
}
