#include <QtTest/QtTest>

#include "core/NodeFiltering.h"

namespace
{
Node link(const QString& title, const QString& url)
{
  Link l;
  l.id = QUuid::createUuid();
  l.title = title;
  l.url = url;
  return Node::fromLink(l);
}

Node folder(const QString& name, bool expanded, const NodeList& children)
{
  Folder f;
  f.id = QUuid::createUuid();
  f.name = name;
  f.expanded = expanded;
  f.children = children;
  return Node::fromFolder(f);
}

NodeList buildTree()
{
  return {
    folder(QStringLiteral("Work"), true,
           {link(QStringLiteral("GitHub"), QStringLiteral("https://github.com")),
            link(QStringLiteral("Jira Board"), QStringLiteral("https://x/jira"))}),
    folder(QStringLiteral("Personal"), false, {link(QStringLiteral("Reddit"), QStringLiteral("https://reddit.com"))}),
    link(QStringLiteral("Hacker News"), QStringLiteral("https://news.ycombinator.com")),
  };
}

QStringList linkTitles(const NodeList& nodes)
{
  QStringList out;
  for (const Node& node : nodes) {
    if (node.isLink()) {
      out.push_back(node.link.title);
    } else {
      out += linkTitles(node.folder.children);
    }
  }
  return out;
}
}

class TestNodeFiltering final : public QObject
{
  Q_OBJECT

private slots:
  void blankQuery_returnsInput()
  {
    const NodeList tree = buildTree();
    QVERIFY(arcmark::filterNodes(tree, QString()) == tree);
    QVERIFY(arcmark::filterNodes(tree, QStringLiteral("   ")) == tree);
  }

  void childMatch_keepsParentWithOnlyMatches()
  {
    const NodeList tree = buildTree();
    const NodeList result = arcmark::filterNodes(tree, QStringLiteral("jira"));

    QCOMPARE(result.size(), std::size_t(1));
    QVERIFY(result.at(0).isFolder());
    QCOMPARE(result.at(0).folder.name, QStringLiteral("Work"));
    QCOMPARE(result.at(0).folder.id, tree.at(0).folder.id);
    QCOMPARE(result.at(0).folder.children.size(), std::size_t(1));
    QCOMPARE(result.at(0).folder.children.at(0).link.title, QStringLiteral("Jira Board"));
    QVERIFY(result.at(0).folder.expanded);
  }

  void urlMatch_findsRootLink()
  {
    const NodeList result = arcmark::filterNodes(buildTree(), QStringLiteral("ycombinator"));
    QCOMPARE(linkTitles(result), QStringList{QStringLiteral("Hacker News")});
    QCOMPARE(result.size(), std::size_t(1));
  }

  void caseInsensitive()
  {
    const NodeList tree = buildTree();
    const QStringList expected{QStringLiteral("GitHub")};
    QCOMPARE(linkTitles(arcmark::filterNodes(tree, QStringLiteral("GITHUB"))), expected);
    QCOMPARE(linkTitles(arcmark::filterNodes(tree, QStringLiteral("github"))), expected);
  }

  void folderNameMatch_keepsAllDescendantsExpanded()
  {
    const NodeList tree = buildTree();
    const NodeList result = arcmark::filterNodes(tree, QStringLiteral("person"));

    QCOMPARE(result.size(), std::size_t(1));
    QCOMPARE(result.at(0).folder.name, QStringLiteral("Personal"));
    QVERIFY(result.at(0).folder.expanded);
    QCOMPARE(linkTitles(result), QStringList{QStringLiteral("Reddit")});
  }

  void folderAndChildMatch_keepsOnlyMatchingChildren()
  {
    const NodeList tree = {
      folder(QStringLiteral("Work"), false,
             {link(QStringLiteral("Workday"), QStringLiteral("https://workday.example")),
              link(QStringLiteral("GitHub"), QStringLiteral("https://github.com"))}),
    };

    const NodeList result = arcmark::filterNodes(tree, QStringLiteral("work"));
    QCOMPARE(result.size(), std::size_t(1));
    QCOMPARE(result.at(0).folder.id, tree.at(0).folder.id);
    QVERIFY(result.at(0).folder.expanded);
    QCOMPARE(linkTitles(result), QStringList{QStringLiteral("Workday")});
  }

  void nestedFolderNameMatch_keepsThatFolderWhole()
  {
    const NodeList tree = {
      folder(QStringLiteral("Projects"), false,
             {folder(QStringLiteral("Archive"), false,
                     {link(QStringLiteral("Old"), QStringLiteral("https://old.example")),
                      link(QStringLiteral("Older"), QStringLiteral("https://older.example"))}),
              link(QStringLiteral("Current"), QStringLiteral("https://current.example"))}),
    };

    const NodeList result = arcmark::filterNodes(tree, QStringLiteral("archive"));
    QCOMPARE(result.size(), std::size_t(1));
    QCOMPARE(result.at(0).folder.children.size(), std::size_t(1));
    const Node& archive = result.at(0).folder.children.at(0);
    QCOMPARE(archive.folder.name, QStringLiteral("Archive"));
    QVERIFY(archive.folder.expanded);
    QCOMPARE(linkTitles(result), (QStringList{QStringLiteral("Old"), QStringLiteral("Older")}));
  }

  void nestedMatch_keepsBranch()
  {
    const NodeList tree = {
      folder(QStringLiteral("Outer"), false,
             {folder(QStringLiteral("Inner"), false, {link(QStringLiteral("Deep"), QStringLiteral("https://deep.example"))}),
              link(QStringLiteral("Shallow"), QStringLiteral("https://shallow.example"))}),
    };

    const NodeList result = arcmark::filterNodes(tree, QStringLiteral("deep"));
    QCOMPARE(result.size(), std::size_t(1));
    QVERIFY(result.at(0).folder.expanded);
    QCOMPARE(result.at(0).folder.children.size(), std::size_t(1));
    QVERIFY(result.at(0).folder.children.at(0).folder.expanded);
    QCOMPARE(linkTitles(result), QStringList{QStringLiteral("Deep")});
  }

  void noMatch_returnsEmpty()
  {
    QVERIFY(arcmark::filterNodes(buildTree(), QStringLiteral("zzz")).empty());
  }

  void input_isNotMutated()
  {
    const NodeList tree = buildTree();
    const NodeList copy = tree;
    arcmark::filterNodes(tree, QStringLiteral("github"));
    arcmark::filterNodes(tree, QStringLiteral("person"));
    QVERIFY(tree == copy);
    QVERIFY(!tree.at(1).folder.expanded);
  }
};

QTEST_GUILESS_MAIN(TestNodeFiltering)

#include "TestNodeFiltering.moc"
