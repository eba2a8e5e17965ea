#include "layoutof/parsers/cpp/type_parser_cpp.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include "layoutof/layout_version.hpp"

#include "clang/AST/AST.h"
#include "clang/AST/RecordLayout.h"
#include "clang/AST/RecursiveASTVisitor.h"
#include "clang/Frontend/CompilerInstance.h"
#include "clang/Frontend/FrontendAction.h"
#include "clang/Tooling/CommonOptionsParser.h"
#include "clang/Tooling/Tooling.h"
#include "llvm/Config/llvm-config.h"

namespace layoutof
{
    namespace detail
    {
        clang::PrintingPolicy get_printing_policy(const clang::ASTContext& ast_context)
        {
            clang::PrintingPolicy policy {ast_context.getLangOpts()};
            policy.SuppressTagKeyword = true;
            policy.FullyQualifiedName = true;
            policy.Bool = true;
            return policy;
        }

        std::string get_type_name(const clang::ASTContext& ast_context, const clang::QualType type)
        {
            return type.getCanonicalType().getUnqualifiedType().getAsString(get_printing_policy(ast_context));
        }

        // References are stored as pointers, sizeof on them yields the size of the referee.
        std::size_t get_storage_size(const clang::ASTContext& ast_context, const clang::QualType type)
        {
            if (type->isReferenceType())
            {
                return static_cast<std::size_t>(ast_context.getTypeSizeInChars(ast_context.VoidPtrTy).getQuantity());
            }

            if (type->isIncompleteType() || type->isDependentType())
            {
                return 0;
            }

            return static_cast<std::size_t>(ast_context.getTypeSizeInChars(type).getQuantity());
        }

        struct layout_collector
        {
            clang::ASTContext& ast_context;
            type_database& database;
            std::set<const clang::RecordDecl*> visited;

            void add_type(const clang::QualType type)
            {
                const clang::QualType canonical_type = type.getCanonicalType();

                if (canonical_type->isDependentType())
                {
                    return;
                }

                if (const clang::RecordDecl* record_decl = canonical_type->getAsRecordDecl())
                {
                    if (const clang::RecordDecl* definition = record_decl->getDefinition())
                    {
                        add_record(*definition);
                    }

                    return;
                }

                const std::string name = get_type_name(ast_context, canonical_type);

                if (database.find_type(name) != nullptr || canonical_type->isIncompleteType())
                {
                    return;
                }

                type_record record;
                record.name = name;
                record.kind = canonical_type->isPointerType() || canonical_type->isReferenceType() ? type_kind::pointer : type_kind::primitive;
                record.size = get_storage_size(ast_context, canonical_type);
                record.alignment = static_cast<std::size_t>(ast_context.getTypeAlignInChars(canonical_type).getQuantity());

                database.add_type(std::move(record));
            }

            void add_record(const clang::RecordDecl& decl)
            {
                if (decl.isInvalidDecl() || decl.isDependentType() || !decl.isCompleteDefinition())
                {
                    return;
                }

                if (!visited.insert(&decl).second)
                {
                    return;
                }

                const clang::ASTRecordLayout& layout = ast_context.getASTRecordLayout(&decl);

                type_record record;
                record.name = get_type_name(ast_context, ast_context.getRecordType(&decl));
                record.kind = decl.isUnion() ? type_kind::union_ : type_kind::struct_;
                record.size = static_cast<std::size_t>(layout.getSize().getQuantity());
                record.alignment = static_cast<std::size_t>(layout.getAlignment().getQuantity());

                if (const clang::CXXRecordDecl* cxx_decl = llvm::dyn_cast<clang::CXXRecordDecl>(&decl))
                {
                    add_bases(*cxx_decl, layout, record);
                }

                for (const clang::Decl* member_decl : decl.decls())
                {
                    if (const clang::FieldDecl* field_decl = llvm::dyn_cast<clang::FieldDecl>(member_decl))
                    {
                        record.fields.emplace_back(make_field(*field_decl, layout));
                    }
                    else if (const clang::VarDecl* var_decl = llvm::dyn_cast<clang::VarDecl>(member_decl))
                    {
                        if (var_decl->isStaticDataMember())
                        {
                            field_record& field = record.fields.emplace_back();
                            field.name = var_decl->getNameAsString();
                            field.type = get_type_name(ast_context, var_decl->getType());
                            field.size = get_storage_size(ast_context, var_decl->getType());
                        }
                    }
                }

                SPDLOG_DEBUG("recorded layout, type={} size={} fields={}", record.name, record.size, record.fields.size());
                database.add_type(std::move(record));
            }

            void add_bases(const clang::CXXRecordDecl& decl, const clang::ASTRecordLayout& layout, type_record& record)
            {
                if (layout.hasOwnVFPtr())
                {
                    field_record& field = record.fields.emplace_back();
                    field.name = fmt::format("_vptr.{}", decl.getNameAsString());
                    field.offset = 0;
                    field.size = get_storage_size(ast_context, ast_context.VoidPtrTy);
                    field.type = get_type_name(ast_context, ast_context.VoidPtrTy);
                }

                for (const clang::CXXBaseSpecifier& base : decl.bases())
                {
                    const clang::CXXRecordDecl* base_decl = base.getType()->getAsCXXRecordDecl();

                    if (base_decl == nullptr || base_decl->getDefinition() == nullptr)
                    {
                        continue;
                    }

                    const clang::CharUnits offset = base.isVirtual()
                                                        ? layout.getVBaseClassOffset(base_decl)
                                                        : layout.getBaseClassOffset(base_decl);

                    field_record& field = record.fields.emplace_back();
                    field.type = get_type_name(ast_context, base.getType());
                    field.name = field.type;
                    field.offset = static_cast<std::size_t>(offset.getQuantity());
                    field.size = get_storage_size(ast_context, base.getType());

                    add_record(*base_decl->getDefinition());
                }
            }

            field_record make_field(const clang::FieldDecl& decl, const clang::ASTRecordLayout& layout)
            {
                constexpr std::size_t char_bits = 8;

                const std::uint64_t offset_bits = layout.getFieldOffset(decl.getFieldIndex());

                field_record field;
                field.name = decl.isAnonymousStructOrUnion() || decl.getName().empty() ? "<anonymous>" : decl.getNameAsString();
                field.type = get_type_name(ast_context, decl.getType());
                field.offset = static_cast<std::size_t>(offset_bits / char_bits);

                if (decl.isBitField())
                {
                    // Bit-fields are widened to the bytes they touch.
                    const std::uint64_t width = decl.getBitWidthValue(ast_context);
                    field.size = static_cast<std::size_t>((offset_bits % char_bits + width + char_bits - 1) / char_bits);
                }
                else
                {
                    field.size = get_storage_size(ast_context, decl.getType());
                }

                add_type(decl.getType());
                return field;
            }
        };

        struct frontend_action_context
        {
            type_database& database;
            const std::set<std::string>& source_paths;
        };

        struct ast_visitor : clang::RecursiveASTVisitor<ast_visitor>
        {
            frontend_action_context& action_context;
            clang::ASTContext& ast_context;
            layout_collector collector;

            explicit ast_visitor(frontend_action_context& action_context, clang::ASTContext& ast_context)
                : action_context(action_context),
                  ast_context(ast_context),
                  collector {ast_context, action_context.database, {}}
            {
            }

            [[maybe_unused]] bool shouldVisitTemplateInstantiations() const
            {
                return true;
            }

            [[maybe_unused]] bool shouldWalkTypesOfTypeLocs() const
            {
                return false;
            }

            [[maybe_unused]] bool VisitRecordDecl(clang::RecordDecl* decl)
            {
                if (decl != nullptr && decl->isThisDeclarationADefinition() && !decl->isLambda() && is_source_decl(*decl))
                {
                    collector.add_record(*decl);
                }

                return true;
            }

            [[maybe_unused]] bool VisitTypedefNameDecl(clang::TypedefNameDecl* decl)
            {
                if (decl != nullptr && !decl->getUnderlyingType()->isDependentType() && is_source_decl(*decl))
                {
                    const clang::QualType underlying_type = decl->getUnderlyingType();
                    action_context.database.aliases.insert_or_assign(decl->getQualifiedNameAsString(), get_type_name(ast_context, underlying_type));
                    collector.add_type(underlying_type);
                }

                return true;
            }

            [[maybe_unused]] bool VisitVarDecl(clang::VarDecl* decl)
            {
                if (decl != nullptr && !decl->isImplicit() && decl->hasGlobalStorage() && !decl->isStaticDataMember() && is_source_decl(*decl))
                {
                    const clang::DeclContext* context = decl->getDeclContext();

                    if (context->isTranslationUnit() || context->isNamespace())
                    {
                        action_context.database.variables.insert_or_assign(decl->getQualifiedNameAsString(), get_type_name(ast_context, decl->getType()));
                        collector.add_type(decl->getType());
                    }
                }

                return true;
            }

            bool is_source_decl(const clang::Decl& decl) const
            {
                const clang::SourceManager& source_manager = ast_context.getSourceManager();
                const clang::SourceLocation location = source_manager.getExpansionLoc(decl.getLocation());
                const clang::FileID file_id = source_manager.getFileID(location);

                if (const clang::FileEntry* file_entry = source_manager.getFileEntryForID(file_id))
                {
                    const std::string file_path = std::filesystem::absolute(file_entry->tryGetRealPathName().str()).string();
                    return action_context.source_paths.contains(file_path);
                }

                return false;
            }
        };

        struct ast_consumer : clang::ASTConsumer
        {
            frontend_action_context& action_context;

            explicit ast_consumer(frontend_action_context& action_context)
                : action_context(action_context)
            {
            }

            void HandleTranslationUnit(clang::ASTContext& ast_context) override
            {
                ast_visitor visitor {action_context, ast_context};
                visitor.TraverseAST(ast_context);
            }
        };

        struct frontend_action : clang::ASTFrontendAction
        {
            frontend_action_context& action_context;

            explicit frontend_action(frontend_action_context& action_context)
                : action_context(action_context)
            {
            }

            void ExecuteAction() override
            {
                clang::CompilerInstance& compiler_instance = getCompilerInstance();
                compiler_instance.getFrontendOpts().SkipFunctionBodies = true;

                ASTFrontendAction::ExecuteAction();
            }

            std::unique_ptr<clang::ASTConsumer> CreateASTConsumer(clang::CompilerInstance&, clang::StringRef) override
            {
                return std::make_unique<ast_consumer>(action_context);
            }
        };

        struct frontend_action_factory : clang::tooling::FrontendActionFactory
        {
            frontend_action_context& action_context;

            explicit frontend_action_factory(frontend_action_context& action_context)
                : action_context(action_context)
            {
            }

            std::unique_ptr<clang::FrontendAction> create() override
            {
                return std::make_unique<frontend_action>(action_context);
            }
        };
    }

    bool type_parser_cpp::parse_types(const std::vector<std::string>& paths, type_database& database)
    {
        constexpr std::size_t extra_args = 3;

        std::vector<const char*> args;
        args.reserve(paths.size() + additional_args.size() + extra_args);

        const auto transformer = [](const std::string& arg) { return arg.data(); };

        args.emplace_back(LAYOUTOF_NAME);

        std::ranges::transform(paths, std::back_inserter(args), transformer);

        args.emplace_back("--");
        args.emplace_back("--target=" LLVM_HOST_TRIPLE);

        std::ranges::transform(additional_args, std::back_inserter(args), transformer);

        int args_size = static_cast<int>(args.size());

        llvm::cl::OptionCategory option_category {LAYOUTOF_NAME};
        llvm::Expected<clang::tooling::CommonOptionsParser> options_parser =
            clang::tooling::CommonOptionsParser::create(args_size, args.data(), option_category);

        if (!options_parser)
        {
            SPDLOG_ERROR("invalid clang options: {}", llvm::toString(options_parser.takeError()));
            return false;
        }

        std::string cpp_source;
        std::set<std::string> source_paths;

        for (const std::string& cpp_source_file : options_parser->getSourcePathList())
        {
            std::string cpp_source_path = std::filesystem::absolute(cpp_source_file).string();
            cpp_source += fmt::format("#include \"{}\"\n", cpp_source_path);
            source_paths.emplace(std::move(cpp_source_path));
        }

        constexpr const char cpp_source_path[] = "__layoutof__.cpp";

        clang::tooling::ClangTool clang_tool {options_parser->getCompilations(), {std::string {cpp_source_path}}};
        clang_tool.mapVirtualFile(cpp_source_path, cpp_source);

        detail::frontend_action_context action_context {database, source_paths};
        detail::frontend_action_factory action_factory {action_context};

        const int action_result = clang_tool.run(&action_factory);

        if (action_result != 0)
        {
            SPDLOG_ERROR("failed to compile C++ sources, files={}", fmt::join(paths, ", "));
            return false;
        }

        SPDLOG_DEBUG("parsed C++ sources, files={} types={}", fmt::join(paths, ", "), database.types.size());
        return true;
    }
}
