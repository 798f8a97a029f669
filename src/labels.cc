#include <labels.hh>

using namespace covmerge;

const char *covmerge::PLACEHOLDER_LABEL = "__covmerge_all_labels__";

LabelsIndex::LabelsIndex()
{
	m_ids[PLACEHOLDER_LABEL_ID] = PLACEHOLDER_LABEL;
	m_labels[PLACEHOLDER_LABEL] = PLACEHOLDER_LABEL_ID;
}

unsigned int LabelsIndex::getOrAdd(const std::string &label)
{
	LabelMap_t::const_iterator it = m_labels.find(label);

	if (it != m_labels.end())
		return it->second;

	// Never 0, the placeholder is always there
	unsigned int id = m_ids.rbegin()->first + 1;

	m_ids[id] = label;
	m_labels[label] = id;

	return id;
}

bool LabelsIndex::insert(unsigned int id, const std::string &label)
{
	IdMap_t::const_iterator byId = m_ids.find(id);
	LabelMap_t::const_iterator byLabel = m_labels.find(label);

	if (byId != m_ids.end() || byLabel != m_labels.end())
		return byId != m_ids.end() && byId->second == label;

	m_ids[id] = label;
	m_labels[label] = id;

	return true;
}

bool LabelsIndex::lookupId(const std::string &label, unsigned int &outId) const
{
	LabelMap_t::const_iterator it = m_labels.find(label);

	if (it == m_labels.end())
		return false;

	outId = it->second;

	return true;
}

bool LabelsIndex::lookupLabel(unsigned int id, std::string &outLabel) const
{
	IdMap_t::const_iterator it = m_ids.find(id);

	if (it == m_ids.end())
		return false;

	outLabel = it->second;

	return true;
}

bool LabelsIndex::hasId(unsigned int id) const
{
	return m_ids.find(id) != m_ids.end();
}

bool LabelsIndex::isOnlyPlaceholder() const
{
	return m_ids.size() == 1;
}

size_t LabelsIndex::size() const
{
	return m_ids.size();
}

const LabelsIndex::IdMap_t &LabelsIndex::getEntries() const
{
	return m_ids;
}
