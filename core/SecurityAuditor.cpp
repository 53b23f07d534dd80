/*
 * SecurityAuditor.cpp
 *
 *  Static gate for candidate method bodies. The body is parsed, never run.
 */

#include "../headers/autopo_internal.h"
#include <set>

namespace autopo
{
    AuditVerdict AuditVerdict::pass(std::vector<std::string> warnings)
    {
        AuditVerdict verdict;
        verdict.passed = true;
        verdict.warnings = std::move(warnings);
        return verdict;
    }

    AuditVerdict AuditVerdict::fail(std::string reason)
    {
        AuditVerdict verdict;
        verdict.passed = false;
        verdict.reason = std::move(reason);
        return verdict;
    }

    namespace {
        const std::set<std::string>& deniedIdentifiers()
        {
            static const std::set<std::string> names = {
                // file access
                "open", "file", "input",
                // dynamic evaluation
                "eval", "exec", "compile", "__import__",
                // process control
                "exit", "quit", "system", "popen", "spawn", "fork",
                "os", "sys", "subprocess", "shutil",
                // environment
                "env", "getenv", "environ",
                // network
                "socket", "connect",
                // reflection
                "globals", "locals", "vars"
            };
            return names;
        }

        bool isDunder(const std::string& name)
        {
            return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
        }

        bool rootsAtSelf(const Node& node)
        {
            const Node* current = &node;
            while (current->kind == NodeKind::Member || current->kind == NodeKind::Index)
                current = &current->child(0);
            return current->kind == NodeKind::SelfRef;
        }

        /** True when \a statement can write to the attribute mapping. */
        bool mutatesSelf(const Node& statement)
        {
            bool found = false;
            walk(statement, [&found](const Node& node) {
                if (found) return;
                if (node.kind == NodeKind::Assign && rootsAtSelf(node.child(0)) && node.child(0).kind != NodeKind::SelfRef)
                {
                    found = true;
                }
                else if (node.kind == NodeKind::Call && node.size() > 0)
                {
                    const Node& callee = node.child(0);
                    if (callee.kind == NodeKind::Name &&
                        (callee.text == "setattr" || callee.text == "append" || callee.text == "put") &&
                        node.size() > 1 && rootsAtSelf(node.child(1)))
                    {
                        found = true;
                    }
                    else if (callee.kind == NodeKind::Member &&
                             (callee.text == "append" || callee.text == "put") &&
                             rootsAtSelf(callee.child(0)) && callee.child(0).kind != NodeKind::SelfRef)
                    {
                        found = true;
                    }
                }
            });
            return found;
        }

        /**
         * A mutating definition honours the commit covenant when its body
         * ends with `commit;`, or with `commit;` directly followed by a
         * final `return`.
         */
        bool endsWithCommit(const Node& block)
        {
            const size_t count = block.size();
            if (count == 0) return false;
            if (block.child(count - 1).kind == NodeKind::Commit) return true;
            return count >= 2 &&
                   block.child(count - 1).kind == NodeKind::Return &&
                   block.child(count - 2).kind == NodeKind::Commit;
        }

        std::string position(const Node& node)
        {
            return " (line " + std::to_string(node.line) + ")";
        }
    }

    SecurityAuditor::SecurityAuditor(bool requireCommitMarker) : requireCommitMarker(requireCommitMarker)
    {
    }

    bool SecurityAuditor::isDeniedIdentifier(const std::string& name)
    {
        return isDunder(name) || deniedIdentifiers().count(name) > 0;
    }

    AuditVerdict SecurityAuditor::audit(const std::string& source) const
    {
        std::unique_ptr<Node> program;
        try
        {
            program = parseSource(source);
        }
        catch (const ParseError& e)
        {
            fprintf(stderr, "ERROR: [AUDIT] syntax error: %s\n", e.what());
            return AuditVerdict::fail(std::string("syntax error: ") + e.what());
        }

        std::string reason;
        walk(*program, [&reason](const Node& node) {
            if (!reason.empty()) return;
            switch (node.kind)
            {
            case NodeKind::Import:
                reason = "forbidden construct: import of '" + node.text + "'" + position(node);
                break;
            case NodeKind::Delete:
                reason = "forbidden construct: del statement" + position(node);
                break;
            case NodeKind::Name:
            case NodeKind::Parameter:
            case NodeKind::Let:
            case NodeKind::For:
                if (isDeniedIdentifier(node.text))
                    reason = "forbidden name: '" + node.text + "'" + position(node);
                break;
            case NodeKind::Member:
            case NodeKind::FunctionDef:
            case NodeKind::KeywordArgument:
                // attribute, method and keyword names only resolve inside the object
                if (isDunder(node.text))
                    reason = "forbidden name: '" + node.text + "'" + position(node);
                break;
            case NodeKind::Literal:
                // getattr(self, "__class__") style reflection through a string
                if (node.literal.isString() && isDunder(node.literal.asString()))
                    reason = "forbidden name: '" + node.literal.asString() + "'" + position(node);
                break;
            default:
                break;
            }
        });
        if (!reason.empty())
        {
            fprintf(stderr, "ERROR: [AUDIT] %s\n", reason.c_str());
            return AuditVerdict::fail(reason);
        }

        std::vector<std::string> warnings;
        for (const auto& definition : program->children)
        {
            if (definition->kind != NodeKind::FunctionDef)
                continue;
            const Node& block = definition->child(definition->size() - 1);
            if (mutatesSelf(block) && !endsWithCommit(block))
            {
                const std::string finding = "'" + definition->text + "' mutates self but does not end with commit" +
                                            position(*definition);
                if (requireCommitMarker)
                {
                    fprintf(stderr, "ERROR: [AUDIT] %s\n", finding.c_str());
                    return AuditVerdict::fail(finding);
                }
                fprintf(stderr, "WARNING: [AUDIT] %s\n", finding.c_str());
                warnings.push_back(finding);
            }
        }

        if (diagEnabled())
            fprintf(stderr, "DEBUG: [AUDIT] passed (%zu warnings)\n", warnings.size());
        return AuditVerdict::pass(std::move(warnings));
    }

    AuditVerdict SecurityAuditor::audit(const std::string& source, const std::string& methodName) const
    {
        AuditVerdict verdict = audit(source);
        if (!verdict.passed)
            return verdict;

        // audit(source) already parsed it once; a second parse cannot fail.
        std::unique_ptr<Node> program = parseSource(source);
        const Node* definition = findFunction(*program, methodName);
        if (!definition)
        {
            const std::string reason = "body does not define '" + methodName + "'";
            fprintf(stderr, "ERROR: [AUDIT] %s\n", reason.c_str());
            return AuditVerdict::fail(reason);
        }
        if (definition->size() < 2 || definition->child(0).text != "self")
        {
            const std::string reason = "'" + methodName + "' must take self as its first parameter";
            fprintf(stderr, "ERROR: [AUDIT] %s\n", reason.c_str());
            return AuditVerdict::fail(reason);
        }
        return verdict;
    }
}
