#include <gtest/gtest.h>
#include "core/dependencies.h"
#include "utils/config.h"

using namespace codemend::core;
using codemend::utils::Config;

TEST(DependencyTest, DefaultBackendTable) {
    DependencyResolver resolver;
    TechStack stack = {{"backend", {"FastAPI", "SQLAlchemy"}}};
    std::set<std::string> expected = {"fastapi", "uvicorn", "pydantic", "sqlalchemy", "psycopg2-binary"};
    EXPECT_EQ(resolver.resolve(stack), expected);
}

TEST(DependencyTest, DuplicatesCollapse) {
    DependencyResolver resolver;
    TechStack stack = {{"backend", {"fastapi", "pydantic", "fastapi"}}};
    EXPECT_EQ(resolver.resolve(stack).size(), 3u);
}

TEST(DependencyTest, UnknownNamesAndRolesContributeNothing) {
    DependencyResolver resolver;
    EXPECT_TRUE(resolver.resolve({{"backend", {"rails"}}}).empty());
    EXPECT_TRUE(resolver.resolve({{"frontend", {"react"}}}).empty());
    EXPECT_TRUE(resolver.resolve({}).empty());
    EXPECT_TRUE(resolver.resolve({{"frontend", {"flask"}}}, "backend").empty());
}

TEST(DependencyTest, AddMapping) {
    DependencyResolver resolver;
    resolver.addMapping("backend", "Starlette", {"starlette", "uvicorn"});
    EXPECT_TRUE(resolver.hasMapping("BACKEND", "starlette"));
    std::set<std::string> expected = {"starlette", "uvicorn"};
    EXPECT_EQ(resolver.resolve({{"backend", {"starlette"}}}), expected);

    resolver.addMapping("worker", "celery", {"celery", "redis"});
    EXPECT_EQ(resolver.resolve({{"worker", {"Celery"}}}, "worker").size(), 2u);
}

TEST(DependencyTest, LoadFromConfig) {
    Config& cfg = Config::instance();
    cfg.reset();
    cfg.set("deps.backend.tornado", "tornado");
    cfg.set("deps.backend.flask", "flask, gunicorn");
    cfg.set("deps.broken", "x");

    DependencyResolver resolver;
    EXPECT_EQ(resolver.loadFromConfig(cfg), 2u);
    EXPECT_EQ(resolver.packagesFor("backend", "tornado"), std::vector<std::string>{"tornado"});
    std::vector<std::string> flask = {"flask", "gunicorn"};
    EXPECT_EQ(resolver.packagesFor("backend", "flask"), flask);
    cfg.reset();
}
