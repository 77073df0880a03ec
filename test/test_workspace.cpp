#include "question/QuestionRepository.h"
#include "workspace/PathGuard.h"
#include "workspace/QuestionWorkspace.h"
#include "workspace/WorkspaceMaterializer.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <cstdlib>
#include <unistd.h>

using TestSupport::check;
using TestSupport::readTextFile;
using TestSupport::writeQuestion;
using TestSupport::writeTextFile;

namespace {

std::optional<QuestionConfig> makeQuestion(const QString &questionsRoot) {
    const bool written = writeQuestion(questionsRoot, "calc",
        R"({"name": "calc", "visible_files": ["solution.py", "pkg/helper.py"], "entrypoint": "tests.py"})",
        {{"solution.py", "stock solution\n"},
         {"pkg/helper.py", "stock helper\n"},
         {"tests.py", "visible tests\n"},
         {"hidden_tests.py", "hidden tests\n"},
         {"fixtures/data.txt", "fixture\n"}});
    if (!written) {
        return std::nullopt;
    }
    return QuestionRepository(questionsRoot).load("calc");
}

bool testMaterializeTrustBoundary() {
    QTemporaryDir questions;
    QTemporaryDir scratch;
    if (!check(questions.isValid() && scratch.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    const auto config = makeQuestion(questions.path());
    if (!check(config.has_value(), "Fixture question should load")) {
        return false;
    }

    const WorkspaceMaterializer materializer(scratch.path());
    QMap<QString, QString> submitted;
    submitted.insert("solution.py", "candidate solution\n");
    submitted.insert("hidden_tests.py", "overwritten by candidate\n");
    submitted.insert("tests.py", "also overwritten\n");

    EngineError error;
    auto workspace = materializer.materialize(*config, submitted, &error);
    if (!check(workspace != nullptr, "Materialize failed: " + error.message)) {
        return false;
    }
    const QDir root(workspace->path());
    bool ok = true;
    ok = check(workspace->path().startsWith(scratch.path()), "Workspace should live under the scratch root") && ok;
    ok = check(readTextFile(root.filePath("solution.py")) == "candidate solution\n",
               "Editable file should come from the submission") && ok;
    ok = check(readTextFile(root.filePath("pkg/helper.py")) == "stock helper\n",
               "Unsubmitted editable file should fall back to stock") && ok;
    ok = check(readTextFile(root.filePath("hidden_tests.py")) == "hidden tests\n",
               "Hidden tests must come from the question, not the candidate") && ok;
    ok = check(readTextFile(root.filePath("tests.py")) == "visible tests\n",
               "Visible tests must come from the question, not the candidate") && ok;
    ok = check(readTextFile(root.filePath("fixtures/data.txt")) == "fixture\n", "Nested assets are copied") && ok;
    ok = check(!root.exists("question.json"), "question.json stays out of the sandbox") && ok;

    const QString path = workspace->path();
    workspace.reset();
    ok = check(!QFileInfo::exists(path), "Workspace should be removed when released") && ok;
    return ok;
}

bool testRestoreDiscardsTargetChanges() {
    QTemporaryDir questions;
    QTemporaryDir scratch;
    if (!check(questions.isValid() && scratch.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    const auto config = makeQuestion(questions.path());
    if (!check(config.has_value(), "Fixture question should load")) {
        return false;
    }

    const WorkspaceMaterializer materializer(scratch.path());
    const QMap<QString, QString> submitted{{"solution.py", "candidate solution\n"}};
    auto workspace = materializer.materialize(*config, submitted);
    if (!check(workspace != nullptr, "Materialize failed")) {
        return false;
    }
    const QDir root(workspace->path());
    WorkspaceMaterializer::makeReadOnly(root.path());

    // What a misbehaving target can do with directory write access.
    QFile::remove(root.filePath("hidden_tests.py"));
    writeTextFile(root.path(), "hidden_tests.py", "print('Ran 1 test')\n");
    writeTextFile(root.path(), "unittest.py", "shadow module\n");
    QFile::setPermissions(root.filePath("fixtures"), QFileDevice::ReadOwner | QFileDevice::ExeOwner);

    EngineError error;
    bool ok = true;
    ok = check(materializer.restore(*config, submitted, root.path(), &error), "Restore failed: " + error.message) && ok;
    ok = check(readTextFile(root.filePath("hidden_tests.py")) == "hidden tests\n",
               "Hidden tests should be back to the question's copy") && ok;
    ok = check(!root.exists("unittest.py"), "Planted files should be gone") && ok;
    ok = check(readTextFile(root.filePath("solution.py")) == "candidate solution\n",
               "The submission should be written again") && ok;
    ok = check(readTextFile(root.filePath("fixtures/data.txt")) == "fixture\n", "Nested assets are restored") && ok;
    ok = check(readTextFile(config->rootPath + "/hidden_tests.py") == "hidden tests\n",
               "The question's own assets are never touched") && ok;
    return ok;
}

bool testMaterializeRejectsEscapingEditable() {
    QTemporaryDir questions;
    if (!check(questions.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeQuestion(questions.path(), "evil", R"({"name": "evil", "visible_files": ["../outside.py"]})", {});
    const auto config = QuestionRepository(questions.path()).load("evil");
    if (!check(config.has_value(), "evil should load")) {
        return false;
    }
    EngineError error;
    const auto workspace = WorkspaceMaterializer().materialize(*config, {{"../outside.py", "x"}}, &error);
    return check(!workspace && error.kind == EngineError::Kind::WorkspaceEscape,
                 "An escaping editable path should fail with workspace_escape");
}

bool testPathGuard() {
    QTemporaryDir dir;
    QTemporaryDir outside;
    if (!check(dir.isValid() && outside.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    bool ok = true;
    ok = check(PathGuard::normalizeRelative("a/./b/../c.py") == "a/c.py", "normalize collapses dots") && ok;
    ok = check(PathGuard::normalizeRelative("a\\b.py") == "a/b.py", "normalize converts backslashes") && ok;
    ok = check(PathGuard::normalizeRelative("/etc/passwd").isEmpty(), "Absolute paths are rejected") && ok;
    ok = check(PathGuard::normalizeRelative("C:/x").isEmpty(), "Drive letters are rejected") && ok;
    ok = check(PathGuard::normalizeRelative("a/../../b").isEmpty(), "Climbing out is rejected") && ok;
    ok = check(PathGuard::normalizeRelative("").isEmpty(), "Empty paths are rejected") && ok;

    EngineError error;
    ok = check(PathGuard::resolveInside(dir.path(), "sub/file.py").has_value(),
               "A nested path that does not exist yet is allowed") && ok;
    ok = check(!PathGuard::resolveInside(dir.path(), "../x", &error) &&
                   error.kind == EngineError::Kind::WorkspaceEscape,
               "Parent traversal is a workspace escape") && ok;

    writeTextFile(outside.path(), "secret.txt", "secret");
    const QString link = QDir(dir.path()).filePath("link.txt");
    if (QFile::link(QDir(outside.path()).filePath("secret.txt"), link)) {
        EngineError linkError;
        ok = check(!PathGuard::resolveInside(dir.path(), "link.txt", &linkError) &&
                       linkError.kind == EngineError::Kind::WorkspaceEscape,
                   "A symlink pointing outside the root is an escape") && ok;
    }
    return ok;
}

bool testWorkspaceFileTools() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "desc.md", "level one");
    writeTextFile(dir.path(), "desc_level2.md", "level two");
    writeTextFile(dir.path(), "solution.py", "def f():\n    return 1\n\ndef g():\n    return 1\n");

    QuestionWorkspace workspace(dir.path());
    bool ok = true;
    ok = check(workspace.listFiles() == (QStringList{"desc.md", "desc_level2.md", "solution.py"}),
               "listFiles should be sorted and relative") && ok;
    ok = check(workspace.readDescription(1).value_or(QString()) == "level one", "Level 1 reads desc.md") && ok;
    ok = check(workspace.readDescription(2).value_or(QString()) == "level two", "Level 2 reads desc_level2.md") && ok;

    EngineError missing;
    ok = check(!workspace.readDescription(3, &missing) && missing.kind == EngineError::Kind::NotFound,
               "A missing description is not_found") && ok;

    EngineError ambiguous;
    ok = check(!workspace.applyPatch("solution.py", "return 1", "return 2", &ambiguous) &&
                   ambiguous.kind == EngineError::Kind::InvalidRequest &&
                   ambiguous.message.contains("found 2"),
               "A patch matching twice is rejected") && ok;

    EngineError none;
    ok = check(!workspace.applyPatch("solution.py", "return 3", "return 4", &none) &&
                   none.message.contains("found 0"),
               "A patch matching nothing is rejected") && ok;

    EngineError patchError;
    ok = check(workspace.applyPatch("solution.py", "def g():\n    return 1", "def g():\n    return 2", &patchError),
               "A unique patch applies: " + patchError.message) && ok;
    ok = check(readTextFile(QDir(dir.path()).filePath("solution.py")).endsWith("return 2\n"),
               "Patched content should be written") && ok;

    EngineError escape;
    ok = check(!workspace.readFile("../etc/passwd", &escape) && escape.kind == EngineError::Kind::WorkspaceEscape,
               "Reads outside the workspace are rejected") && ok;
    ok = check(workspace.snapshot().size() == 3, "snapshot should contain every file") && ok;
    return ok;
}

bool testMakeReadOnly() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "a/b.py", "x");
    bool ok = check(WorkspaceMaterializer::makeReadOnly(dir.path()), "makeReadOnly should succeed");
    const QFileInfo info(QDir(dir.path()).filePath("a/b.py"));
    ok = check(!(info.permissions() & QFileDevice::WriteOwner), "Files should lose write permission") && ok;
    if (::geteuid() != 0) {
        QFile file(info.filePath());
        ok = check(!file.open(QIODevice::WriteOnly), "Read-only files cannot be opened for writing") && ok;
    }
    return ok;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    bool ok = true;
    ok = testMaterializeTrustBoundary() && ok;
    ok = testRestoreDiscardsTargetChanges() && ok;
    ok = testMaterializeRejectsEscapingEditable() && ok;
    ok = testPathGuard() && ok;
    ok = testWorkspaceFileTools() && ok;
    ok = testMakeReadOnly() && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
