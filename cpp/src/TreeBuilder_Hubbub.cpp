#include "TreeBuilder_Hubbub.hpp"
#include "Errors.hpp"

#include <exception>
#include <sstream>

extern "C" {
    #include <hubbub/hubbub.h>
    #include <hubbub/parser.h>
    #include <hubbub/tree.h>
};

namespace dissolve
{


/**
 * The hubbub_tree_handler table and its C trampolines.
 *
 * libhubbub hands us back the raw Node pointers we gave it and manages
 * their lifetime through ref_node / unref_node, which map onto the
 * intrusive count. Exceptions thrown by the sink must not unwind through
 * libhubbub's C frames: they are parked in `failure`, the callback reports
 * HUBBUB_UNKNOWN, and TreeBuilder_Hubbub::parse rethrows once control is
 * back on our side.
 */
class TreeBuilderHandler
{
public:
    TreeBuilderHandler(TreeSink& sink, const Log& log);

    hubbub_tree_handler* getHandler() {
        return &handler;
    }

    static hubbub_error create_comment(void *ctx, const hubbub_string *data, void **result);
    static hubbub_error create_doctype(void *ctx, const hubbub_doctype *doctype, void **result);
    static hubbub_error create_element(void *ctx, const hubbub_tag *tag, void **result);
    static hubbub_error create_text(void *ctx, const hubbub_string *data, void **result);
    static hubbub_error ref_node(void *ctx, void *node);
    static hubbub_error unref_node(void *ctx, void *node);
    static hubbub_error append_child(void *ctx, void *parent, void *child, void **result);
    static hubbub_error insert_before(void *ctx, void *parent, void *child, void *ref_child, void **result);
    static hubbub_error remove_child(void *ctx, void *parent, void *child, void **result);
    static hubbub_error clone_node(void *ctx, void *node, bool deep, void **result);
    static hubbub_error reparent_children(void *ctx, void *node, void *new_parent);
    static hubbub_error get_parent(void *ctx, void *node, bool element_only, void **result);
    static hubbub_error has_children(void *ctx, void *node, bool *result);
    static hubbub_error form_associate(void *ctx, void *form, void *node);
    static hubbub_error add_attributes(void *ctx, void *node, const hubbub_attribute *attributes, uint32_t n_attributes);
    static hubbub_error set_quirks_mode(void *ctx, hubbub_quirks_mode mode);
    static hubbub_error encoding_change(void *ctx, const char *encname);
    static hubbub_error complete_script(void *ctx, void *script);

    static void parse_error(uint32_t line, uint32_t col, const char *message, void *pw);

    static string string_from_hubbub(const hubbub_string& str);
    static Namespace ns_from_hubbub(hubbub_ns ns);
    static AttribList attributes_from_hubbub(const hubbub_attribute *attributes, uint32_t n_attributes);
    static ElementFlags flags_for(const QualName& name, bool selfClosing);

    // A reference to the document for libhubbub to own; it releases it
    // through unref_node when the parser is destroyed
    void* documentForHubbub() {
        return node_to_hubbub(document);
    }

    // Rethrow an exception parked by a callback, if any
    void rethrowFailure();
    bool failed() const {
        return static_cast<bool>(failure);
    }

    TreeSink& sink;
    NodePtr document;

private:
    template<class Body>
    static hubbub_error guard(void *ctx, Body body);

    static NodePtr node_from_hubbub(void *node);
    static void* node_to_hubbub(NodePtr node);
    static NodeOrText payload_from(const NodePtr& node);

    Log log;
    // Table whose parent was just looked up by the foster-parenting step;
    // the next append_child is the foster insertion itself
    NodePtr fosterTable;
    std::exception_ptr failure;
    hubbub_tree_handler handler;
};


TreeBuilder_Hubbub::TreeBuilder_Hubbub(TreeSink& sink, const ExtractorOptions& options, const Log& log)
    : hubbubParser(nullptr)
    , handler(new TreeBuilderHandler(sink, log))
    , log(log)
    , completed(false)
{
    hubbub_error error;

    // The encoding is fixed: sniffing and <meta charset> switches are off
    error = hubbub_parser_create(options.encoding.c_str(), true, &hubbubParser);
    if (error != HUBBUB_OK) {
        delete handler;
        handler = nullptr;
        throw ParserError("hubbub_parser_create", error, hubbub_error_to_string(error));
    }

    try {
        handler->document = sink.getDocument();

        hubbub_parser_optparams params;
        params.tree_handler = handler->getHandler();
        error = hubbub_parser_setopt(hubbubParser, HUBBUB_PARSER_TREE_HANDLER, &params);
        if (error != HUBBUB_OK) {
            throw ParserError("HUBBUB_PARSER_TREE_HANDLER", error, hubbub_error_to_string(error));
        }

        params.document_node = handler->documentForHubbub();
        error = hubbub_parser_setopt(hubbubParser, HUBBUB_PARSER_DOCUMENT_NODE, &params);
        if (error != HUBBUB_OK) {
            // Not taken over by libhubbub
            intrusive_ptr_release(static_cast<Node*>(params.document_node));
            throw ParserError("HUBBUB_PARSER_DOCUMENT_NODE", error, hubbub_error_to_string(error));
        }

        params.error_handler.handler = &TreeBuilderHandler::parse_error;
        params.error_handler.pw = static_cast<void*>(handler);
        error = hubbub_parser_setopt(hubbubParser, HUBBUB_PARSER_ERROR_HANDLER, &params);
        if (error != HUBBUB_OK) {
            throw ParserError("HUBBUB_PARSER_ERROR_HANDLER", error, hubbub_error_to_string(error));
        }

        params.enable_scripting = options.scriptingEnabled;
        error = hubbub_parser_setopt(hubbubParser, HUBBUB_PARSER_ENABLE_SCRIPTING, &params);
        if (error != HUBBUB_OK) {
            throw ParserError("HUBBUB_PARSER_ENABLE_SCRIPTING", error, hubbub_error_to_string(error));
        }
    } catch (...) {
        // The destructor will not run for a half-built object
        destroy();
        throw;
    }
}

TreeBuilder_Hubbub::~TreeBuilder_Hubbub()
{
    if (!completed && handler && !handler->failed()) {
        log.at(LogLevel::Warning) << "tree builder destroyed before EOF was received";
    }
    destroy();
}

void TreeBuilder_Hubbub::destroy()
{
    // Destroying the parser releases its handles through unref_node, so the
    // handler has to outlive it
    if (hubbubParser) {
        hubbub_parser_destroy(hubbubParser);
        hubbubParser = nullptr;
    }
    delete handler;
    handler = nullptr;
}

NodePtr TreeBuilder_Hubbub::document() const
{
    return handler->document;
}

void TreeBuilder_Hubbub::parse(const string& input)
{
    if (completed) {
        throw ContractViolation("TreeBuilder_Hubbub::parse called twice");
    }
    completed = true;

    hubbub_error error = HUBBUB_OK;
    if (!input.empty()) {
        error = hubbub_parser_parse_chunk(
            hubbubParser,
            reinterpret_cast<const uint8_t*>(input.data()),
            input.size()
        );
        handler->rethrowFailure();
        if (error != HUBBUB_OK) {
            throw ParserError("hubbub_parser_parse_chunk", error, hubbub_error_to_string(error));
        }
    }

    error = hubbub_parser_completed(hubbubParser);
    handler->rethrowFailure();
    if (error != HUBBUB_OK) {
        throw ParserError("hubbub_parser_completed", error, hubbub_error_to_string(error));
    }
}


TreeBuilderHandler::TreeBuilderHandler(TreeSink& sink, const Log& log)
    : sink(sink)
    , log(log)
{
    handler.create_comment = &TreeBuilderHandler::create_comment;
    handler.create_doctype = &TreeBuilderHandler::create_doctype;
    handler.create_element = &TreeBuilderHandler::create_element;
    handler.create_text = &TreeBuilderHandler::create_text;
    handler.ref_node = &TreeBuilderHandler::ref_node;
    handler.unref_node = &TreeBuilderHandler::unref_node;
    handler.append_child = &TreeBuilderHandler::append_child;
    handler.insert_before = &TreeBuilderHandler::insert_before;
    handler.remove_child = &TreeBuilderHandler::remove_child;
    handler.clone_node = &TreeBuilderHandler::clone_node;
    handler.reparent_children = &TreeBuilderHandler::reparent_children;
    handler.get_parent = &TreeBuilderHandler::get_parent;
    handler.has_children = &TreeBuilderHandler::has_children;
    handler.form_associate = &TreeBuilderHandler::form_associate;
    handler.add_attributes = &TreeBuilderHandler::add_attributes;
    handler.set_quirks_mode = &TreeBuilderHandler::set_quirks_mode;
    handler.encoding_change = &TreeBuilderHandler::encoding_change;
    handler.complete_script = &TreeBuilderHandler::complete_script;

    handler.ctx = static_cast<void *>(this);
}

template<class Body>
hubbub_error TreeBuilderHandler::guard(void *ctx, Body body)
{
    TreeBuilderHandler& self = *static_cast<TreeBuilderHandler*>(ctx);

    // Once something failed the output is void; let libhubbub unwind
    if (self.failure) {
        return HUBBUB_UNKNOWN;
    }
    try {
        body(self);
    } catch (...) {
        // Parked, not swallowed: rethrown by rethrowFailure()
        self.failure = std::current_exception();
        return HUBBUB_UNKNOWN;
    }
    return HUBBUB_OK;
}

void TreeBuilderHandler::rethrowFailure()
{
    if (failure) {
        std::exception_ptr pending = failure;
        failure = std::exception_ptr();
        std::rethrow_exception(pending);
    }
}

hubbub_error TreeBuilderHandler::create_comment(void *ctx, const hubbub_string *data, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        *p_result = node_to_hubbub(self.sink.createComment(string_from_hubbub(*data)));
    });
}

hubbub_error TreeBuilderHandler::create_doctype(void *ctx, const hubbub_doctype *doctype, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        // libhubbub appends the doctype to the document right after
        // creating it, and nothing else ever refers to it
        self.sink.appendDoctypeToDocument(
            string_from_hubbub(doctype->name),
            doctype->public_missing ? string() : string_from_hubbub(doctype->public_id),
            doctype->system_missing ? string() : string_from_hubbub(doctype->system_id)
        );
        *p_result = node_to_hubbub(Node::create(NodeType::Doctype));
    });
}

hubbub_error TreeBuilderHandler::create_element(void *ctx, const hubbub_tag *tag, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        QualName name(ns_from_hubbub(tag->ns), string_from_hubbub(tag->name));
        NodePtr element = self.sink.createElement(
            name,
            attributes_from_hubbub(tag->attributes, tag->n_attributes),
            flags_for(name, tag->self_closing)
        );
        *p_result = node_to_hubbub(element);
    });
}

hubbub_error TreeBuilderHandler::create_text(void *ctx, const hubbub_string *data, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        *p_result = node_to_hubbub(Node::createText(string_from_hubbub(*data)));
    });
}

hubbub_error TreeBuilderHandler::ref_node(void *ctx, void *p_node)
{
    if (p_node) {
        intrusive_ptr_add_ref(static_cast<Node*>(p_node));
    }
    return HUBBUB_OK;
}

hubbub_error TreeBuilderHandler::unref_node(void *ctx, void *p_node)
{
    if (p_node) {
        intrusive_ptr_release(static_cast<Node*>(p_node));
    }
    return HUBBUB_OK;
}

hubbub_error TreeBuilderHandler::append_child(void *ctx, void *p_parent, void *p_child, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        NodePtr parent = node_from_hubbub(p_parent);
        NodePtr child = node_from_hubbub(p_child);

        if (self.fosterTable) {
            NodePtr table;
            table.swap(self.fosterTable);
            self.sink.appendBasedOnParentNode(table, parent, payload_from(child));
        } else {
            self.sink.append(parent, payload_from(child));
        }
        *p_result = node_to_hubbub(child);
    });
}

// Only reached through foster parenting when the table has a parent, which
// get_parent never reports
hubbub_error TreeBuilderHandler::insert_before(void *ctx, void *p_parent, void *p_child, void *p_ref_child, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        NodePtr child = node_from_hubbub(p_child);

        self.fosterTable.reset();
        self.sink.appendBeforeSibling(node_from_hubbub(p_ref_child), payload_from(child));
        *p_result = node_to_hubbub(child);
    });
}

hubbub_error TreeBuilderHandler::remove_child(void *ctx, void *p_parent, void *p_child, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        NodePtr child = node_from_hubbub(p_child);

        self.sink.removeFromParent(child);
        *p_result = node_to_hubbub(child);
    });
}

// Used for formatting elements, which are always cloned shallow
hubbub_error TreeBuilderHandler::clone_node(void *ctx, void *p_node, bool deep, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        NodePtr node = node_from_hubbub(p_node);
        NodePtr copy;

        if (node->isElement()) {
            const QualName& name = self.sink.elemName(node);
            copy = self.sink.createElement(name, AttribList(), flags_for(name, false));
        } else {
            copy = node->clone();
        }
        *p_result = node_to_hubbub(copy);
    });
}

hubbub_error TreeBuilderHandler::reparent_children(void *ctx, void *p_node, void *p_new_parent)
{
    return guard(ctx, [&](TreeBuilderHandler& self) {
        self.sink.reparentChildren(node_from_hubbub(p_node), node_from_hubbub(p_new_parent));
    });
}

// No parent links exist, so every node looks detached. For a table this
// makes libhubbub foster-parent into the element below it on the stack of
// open elements, with append_child instead of insert_before. Only the
// foster-parenting step asks for an element parent; removals during the
// adoption agency ask with element_only unset.
hubbub_error TreeBuilderHandler::get_parent(void *ctx, void *p_node, bool element_only, void **p_result)
{
    *p_result = nullptr;
    return guard(ctx, [&](TreeBuilderHandler& self) {
        NodePtr node = node_from_hubbub(p_node);

        if (element_only
                && node->isElement()
                && self.sink.elemName(node) == QualName(Namespace::Html, "table")) {
            self.fosterTable = node;
        }
    });
}

hubbub_error TreeBuilderHandler::has_children(void *ctx, void *p_node, bool *result)
{
    *result = false;
    return HUBBUB_OK;
}

hubbub_error TreeBuilderHandler::form_associate(void *ctx, void *p_form, void *p_node)
{
    return HUBBUB_OK;
}

hubbub_error TreeBuilderHandler::add_attributes(void *ctx, void *p_node, const hubbub_attribute *attributes, uint32_t n_attributes)
{
    return guard(ctx, [&](TreeBuilderHandler& self) {
        self.sink.addAttributesIfMissing(
            node_from_hubbub(p_node),
            attributes_from_hubbub(attributes, n_attributes)
        );
    });
}

hubbub_error TreeBuilderHandler::set_quirks_mode(void *ctx, hubbub_quirks_mode mode)
{
    return guard(ctx, [&](TreeBuilderHandler& self) {
        switch (mode) {
        case HUBBUB_QUIRKS_MODE_FULL:
            self.sink.setQuirksMode(QuirksMode::Quirks);
            break;
        case HUBBUB_QUIRKS_MODE_LIMITED:
            self.sink.setQuirksMode(QuirksMode::LimitedQuirks);
            break;
        case HUBBUB_QUIRKS_MODE_NONE:
        default:
            self.sink.setQuirksMode(QuirksMode::NoQuirks);
            break;
        }
    });
}

hubbub_error TreeBuilderHandler::encoding_change(void *ctx, const char *encname)
{
    TreeBuilderHandler& self = *static_cast<TreeBuilderHandler*>(ctx);
    self.log.at(LogLevel::Debug)
        << "document declares charset " << (encname ? encname : "(null)")
        << ", keeping the configured one";
    return HUBBUB_OK;
}

hubbub_error TreeBuilderHandler::complete_script(void *ctx, void *script)
{
    return HUBBUB_OK;
}

void TreeBuilderHandler::parse_error(uint32_t line, uint32_t col, const char *message, void *pw)
{
    TreeBuilderHandler& self = *static_cast<TreeBuilderHandler*>(pw);
    if (self.failed()) {
        // An earlier callback already failed; parse() rethrows that one
        return;
    }
    hubbub_error error = guard(pw, [&](TreeBuilderHandler&) {
        std::ostringstream oss;
        oss << line << ":" << col << ": " << (message ? message : "");
        self.sink.parseError(oss.str());
    });
    if (error != HUBBUB_OK) {
        // The error handler cannot fail towards libhubbub; parse() rethrows
        self.log.at(LogLevel::Debug)
            << "sink failed while reporting a parse error";
    }
}

string TreeBuilderHandler::string_from_hubbub(const hubbub_string& str)
{
    if (str.ptr == nullptr) {
        return string();
    }
    return string(reinterpret_cast< const char* >(str.ptr), str.len);
}

Namespace TreeBuilderHandler::ns_from_hubbub(hubbub_ns ns)
{
    switch (ns) {
    case HUBBUB_NS_HTML:
        return Namespace::Html;
    case HUBBUB_NS_MATHML:
        return Namespace::MathML;
    case HUBBUB_NS_SVG:
        return Namespace::Svg;
    case HUBBUB_NS_XLINK:
        return Namespace::XLink;
    case HUBBUB_NS_XML:
        return Namespace::Xml;
    case HUBBUB_NS_XMLNS:
        return Namespace::XmlNs;
    case HUBBUB_NS_NULL:
    default:
        break;
    }
    return Namespace::None;
}

AttribList TreeBuilderHandler::attributes_from_hubbub(const hubbub_attribute *attributes, uint32_t n_attributes)
{
    AttribList result;
    result.reserve(n_attributes);

    for (uint32_t i = 0; i < n_attributes; i++)
    {
        const hubbub_attribute& h_attr = attributes[i];
        Attribute attr;
        attr.name = QualName(ns_from_hubbub(h_attr.ns), string_from_hubbub(h_attr.name));
        attr.value = string_from_hubbub(h_attr.value);
        result.push_back(attr);
    }
    return result;
}

ElementFlags TreeBuilderHandler::flags_for(const QualName& name, bool selfClosing)
{
    ElementFlags flags;
    flags.isTemplate = (name == QualName(Namespace::Html, "template"));
    flags.selfClosing = selfClosing;
    return flags;
}

// Borrow: the temporary handle adds and drops its own reference
NodePtr TreeBuilderHandler::node_from_hubbub(void *p_node)
{
    if (p_node == nullptr) {
        throw ContractViolation("libhubbub passed a null node handle");
    }
    return NodePtr(static_cast<Node*>(p_node));
}

// Hand one reference over to libhubbub
void* TreeBuilderHandler::node_to_hubbub(NodePtr node)
{
    return static_cast<void*>(node.detach());
}

NodeOrText TreeBuilderHandler::payload_from(const NodePtr& node)
{
    if (node->isText()) {
        return NodeOrText(node->text());
    }
    return NodeOrText(node);
}


}
