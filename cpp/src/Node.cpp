#include "Node.hpp"
#include "Errors.hpp"

namespace dissolve
{

std::ostream& operator<<(std::ostream& os, const QualName& name)
{
    switch (name.ns) {
    case Namespace::MathML:
        os << "math:";
        break;
    case Namespace::Svg:
        os << "svg:";
        break;
    case Namespace::XLink:
        os << "xlink:";
        break;
    case Namespace::Xml:
        os << "xml:";
        break;
    case Namespace::XmlNs:
        os << "xmlns:";
        break;
    case Namespace::Html:
    case Namespace::None:
    default:
        break;
    }
    return os << name.local;
}

Node::Node( NodeType type, const QualName& name, const string& payload )
    : nodeType( type )
    , name( name )
    , payload( payload )
{}

NodePtr
Node::create( NodeType type ) {
    if ( type == NodeType::Element || type == NodeType::Text ) {
        throw ContractViolation( string( "Node::create: " ) + typeName( type )
                + " nodes need a name or payload" );
    }
    return NodePtr( new Node( type, QualName(), string() ) );
}

NodePtr
Node::createElement( const QualName& name ) {
    return NodePtr( new Node( NodeType::Element, name, string() ) );
}

NodePtr
Node::createText( const string& text ) {
    return NodePtr( new Node( NodeType::Text, QualName(), text ) );
}

const QualName&
Node::qualifiedName() const {
    if ( nodeType != NodeType::Element ) {
        throw ContractViolation( string( "qualified name requested from a " )
                + typeName( nodeType ) + " node" );
    }
    return name;
}

const string&
Node::text() const {
    if ( nodeType != NodeType::Text ) {
        throw ContractViolation( string( "text requested from a " )
                + typeName( nodeType ) + " node" );
    }
    return payload;
}

NodePtr
Node::clone() const {
    return NodePtr( new Node( nodeType, name, payload ) );
}

const char*
Node::typeName( NodeType type ) {
    switch ( type ) {
        case NodeType::Document:
            return "Document";
        case NodeType::Doctype:
            return "Doctype";
        case NodeType::Comment:
            return "Comment";
        case NodeType::ProcessingInstruction:
            return "ProcessingInstruction";
        case NodeType::Element:
            return "Element";
        case NodeType::Text:
            return "Text";
    }
    return "Unknown";
}

} // namespace dissolve
